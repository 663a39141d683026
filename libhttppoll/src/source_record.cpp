//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/source_record.hpp"

#include "httppoll/json.hpp"

#include <algorithm>

namespace httppoll {

auto source_record::header(std::string_view name) const
  -> const http::header* {
  auto i = std::find_if(headers.begin(), headers.end(), [&](const auto& x) {
    return x.name == name;
  });
  return i == headers.end() ? nullptr : &*i;
}

auto assemble(std::string_view topic, const partition& part,
              const offset& off, std::vector<item> items)
  -> std::vector<source_record> {
  auto result = std::vector<source_record>{};
  result.reserve(items.size());
  for (auto& x : items) {
    result.push_back({
      .topic = std::string{topic},
      .source_partition = part,
      .source_offset = off,
      .key = std::nullopt,
      .value = std::move(x),
      .headers = {{std::string{source_header}, part.url}},
    });
  }
  return result;
}

auto to_json(const source_record& x) -> std::string {
  auto headers = caf::settings{};
  for (const auto& h : x.headers)
    headers.insert_or_assign(h.name, h.value);
  auto result = caf::settings{};
  result.insert_or_assign("topic", x.topic);
  result.insert_or_assign("partition", to_settings(x.source_partition));
  result.insert_or_assign("offset", x.source_offset);
  result.insert_or_assign("key", x.key ? item{*x.key} : item{});
  result.insert_or_assign("value", x.value);
  result.insert_or_assign("headers", std::move(headers));
  return to_json(result);
}

} // namespace httppoll
