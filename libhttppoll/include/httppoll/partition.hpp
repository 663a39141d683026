//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/fwd.hpp"

#include <caf/settings.hpp>
#include <fmt/format.h>

#include <string>

namespace httppoll {

/// One logical data source of an API client. Partitions are values: they are
/// created once by the client and never change afterwards.
struct partition {
  /// The URL that polls of this partition request.
  std::string url;

  /// The HTTP method of the request.
  std::string method = "GET";

  /// Additional routing information for request builders.
  caf::settings metadata;

  friend auto operator==(const partition&, const partition&) -> bool
    = default;

  friend auto inspect(auto& f, partition& x) -> bool {
    return f.object(x)
      .pretty_name("httppoll.partition")
      .fields(f.field("url", x.url), f.field("method", x.method),
              f.field("metadata", x.metadata));
  }
};

/// Flattens a partition into a map with the keys `url` and `method`, plus all
/// metadata, so that hosts can use it as a persistence key.
/// @relates partition
auto to_settings(const partition& x) -> caf::settings;

/// @relates partition
auto to_string(const partition& x) -> std::string;

} // namespace httppoll

template <>
struct fmt::formatter<httppoll::partition> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const httppoll::partition& x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(httppoll::to_string(x),
                                                    ctx);
  }
};
