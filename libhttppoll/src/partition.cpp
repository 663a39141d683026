//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/partition.hpp"

#include "httppoll/json.hpp"

namespace httppoll {

auto to_settings(const partition& x) -> caf::settings {
  auto result = x.metadata;
  result.insert_or_assign("url", x.url);
  result.insert_or_assign("method", x.method);
  return result;
}

auto to_string(const partition& x) -> std::string {
  if (x.metadata.empty())
    return fmt::format("{} {}", x.method, x.url);
  return fmt::format("{} {} {}", x.method, x.url, to_json(x.metadata));
}

} // namespace httppoll
