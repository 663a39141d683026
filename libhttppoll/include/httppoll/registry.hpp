//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/error.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace httppoll {

/// A thread-safe mapping from names to factories of `T`.
template <class T>
class registry {
public:
  using factory = std::function<auto()->std::unique_ptr<T>>;

  /// Adds a factory.
  /// @returns false if the name is already taken.
  auto add(std::string name, factory f) -> bool {
    auto lock = std::lock_guard{mutex_};
    return factories_.try_emplace(std::move(name), std::move(f)).second;
  }

  /// Checks whether a name is registered.
  auto contains(std::string_view name) const -> bool {
    auto lock = std::lock_guard{mutex_};
    return factories_.find(name) != factories_.end();
  }

  /// Creates a new instance through the factory registered under *name*.
  auto make(std::string_view name) const -> caf::expected<std::unique_ptr<T>> {
    auto f = factory{};
    {
      auto lock = std::lock_guard{mutex_};
      auto it = factories_.find(name);
      if (it == factories_.end())
        return caf::make_error(ec::lookup_error,
                               fmt::format("no factory registered for '{}'",
                                           name));
      f = it->second;
    }
    auto result = f();
    if (not result)
      return caf::make_error(ec::logic_error,
                             fmt::format("factory for '{}' returned nothing",
                                         name));
    return result;
  }

  /// Returns the registered names in lexicographical order.
  auto names() const -> std::vector<std::string> {
    auto lock = std::lock_guard{mutex_};
    auto result = std::vector<std::string>{};
    result.reserve(factories_.size());
    for (const auto& [name, _] : factories_)
      result.push_back(name);
    return result;
  }

private:
  mutable std::mutex mutex_;
  std::map<std::string, factory, std::less<>> factories_;
};

} // namespace httppoll
