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

#include <filesystem>
#include <string_view>

namespace httppoll {

/// Parses a YAML document. Plain scalars are converted to booleans, integers
/// and reals where possible, quoted scalars always remain strings.
auto from_yaml(std::string_view str) -> caf::expected<item>;

/// Loads a YAML configuration file whose top level is a map. An empty file
/// yields empty settings.
auto load_yaml(const std::filesystem::path& file)
  -> caf::expected<caf::settings>;

} // namespace httppoll
