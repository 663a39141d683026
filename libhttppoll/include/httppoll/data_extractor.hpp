//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/fwd.hpp"
#include "httppoll/http.hpp"
#include "httppoll/partition.hpp"
#include "httppoll/registry.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <memory>
#include <string>
#include <vector>

namespace httppoll {

/// Converts the body of a validated response into an ordered sequence of
/// items. This is the extension point for concrete connectors.
class data_extractor {
public:
  virtual ~data_extractor() noexcept = default;

  /// Returns the name of the extractor.
  virtual auto name() const -> std::string = 0;

  /// Configures the extractor from the client configuration. The default
  /// implementation accepts any configuration.
  virtual auto configure(const caf::settings& cfg) -> caf::error;

  /// Extracts items from a response. Called concurrently for distinct
  /// partitions.
  virtual auto extract(const partition& part, const offset& off,
                       const http::response& res) const
    -> caf::expected<std::vector<item>>
    = 0;
};

/// Returns the registry of extractors that the driver selects from through
/// `http.extractor`.
auto extractor_registry() -> registry<data_extractor>&;

} // namespace httppoll

/// Registers an extractor type under a name.
#define HTTPPOLL_REGISTER_EXTRACTOR(type, name)                                \
  template <class>                                                             \
  struct auto_register_extractor;                                              \
  template <>                                                                  \
  struct auto_register_extractor<type> {                                       \
    auto_register_extractor() {                                                \
      static_cast<void>(flag);                                                 \
    }                                                                          \
    static auto init() -> bool {                                               \
      return ::httppoll::extractor_registry().add(                             \
        (name), []() -> std::unique_ptr<::httppoll::data_extractor> {          \
          return std::make_unique<type>();                                     \
        });                                                                    \
    }                                                                          \
    inline static auto flag = init();                                          \
  };
