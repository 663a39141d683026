//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/error.hpp"

#include <caf/config_value.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>

namespace httppoll::detail {

/// Reads an optional option of type `T` from a settings tree.
/// @returns `std::nullopt` if the key does not exist, or an error if the value
/// does not convert to `T`.
template <class T>
auto get_option(const caf::settings& cfg, std::string_view key)
  -> caf::expected<std::optional<T>> {
  const auto* value = caf::get_if(&cfg, key);
  if (value == nullptr)
    return std::optional<T>{};
  auto result = caf::get_as<T>(*value);
  if (not result)
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("invalid value for option '{}': {}",
                                       key, caf::to_string(*value)));
  return std::optional<T>{std::move(*result)};
}

/// Reads a mandatory option of type `T` from a settings tree.
template <class T>
auto get_required(const caf::settings& cfg, std::string_view key)
  -> caf::expected<T> {
  auto result = get_option<T>(cfg, key);
  if (not result)
    return std::move(result.error());
  if (not *result)
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("missing required option '{}'", key));
  return std::move(**result);
}

/// Merges *src* into *dst*, descending into nested dictionaries. Values in
/// *src* win over values in *dst*.
auto merge_settings(const caf::settings& src, caf::settings& dst) -> void;

} // namespace httppoll::detail
