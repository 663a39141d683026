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

#include <caf/config_value.hpp>
#include <caf/settings.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace httppoll {

/// The name of the header that carries the URL a record originates from.
inline constexpr std::string_view source_header = "http.source";

/// A delivery-ready record. The partition and offset describe the state
/// *before* the poll that produced the record.
struct source_record {
  std::string topic;
  partition source_partition;
  offset source_offset;
  std::optional<std::string> key;
  item value;
  std::vector<http::header> headers;

  /// Looks up a header by its exact name.
  [[nodiscard]] auto header(std::string_view name) const
    -> const http::header*;

  friend auto inspect(auto& f, source_record& x) -> bool {
    return f.object(x)
      .pretty_name("httppoll.source_record")
      .fields(f.field("topic", x.topic),
              f.field("partition", x.source_partition),
              f.field("offset", x.source_offset), f.field("key", x.key),
              f.field("value", x.value), f.field("headers", x.headers));
  }
};

/// Wraps every item into a record, preserving order. Each record carries the
/// partition URL in its `http.source` header and has no key.
auto assemble(std::string_view topic, const partition& part,
              const offset& off, std::vector<item> items)
  -> std::vector<source_record>;

/// Renders a record as a single-line JSON object.
auto to_json(const source_record& x) -> std::string;

} // namespace httppoll
