//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/fwd.hpp"

#include <caf/config_value.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <string>
#include <string_view>

namespace httppoll {

/// Parses a JSON document into an item. Objects become dictionaries and arrays
/// become lists. Unsigned numbers beyond the range of a signed 64-bit integer
/// become reals.
auto from_json(std::string_view str) -> caf::expected<item>;

/// Renders an item as single-line JSON.
auto to_json(const item& x) -> std::string;

/// Renders a settings tree as a single-line JSON object.
auto to_json(const caf::settings& xs) -> std::string;

} // namespace httppoll
