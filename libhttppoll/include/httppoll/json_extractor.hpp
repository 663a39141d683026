//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/data_extractor.hpp"

#include <string>
#include <vector>

namespace httppoll {

/// Extracts items from a JSON body. The option `http.response.json-path`
/// selects a nested value through a dot-separated list of field names. An
/// array yields one item per element, `null` and an empty body yield nothing,
/// and any other value yields a single item.
class json_extractor final : public data_extractor {
public:
  auto name() const -> std::string override;

  auto configure(const caf::settings& cfg) -> caf::error override;

  auto extract(const partition& part, const offset& off,
               const http::response& res) const
    -> caf::expected<std::vector<item>> override;

  /// Returns the configured path, split at dots.
  auto path() const -> const std::vector<std::string>&;

private:
  std::vector<std::string> path_;
};

} // namespace httppoll
