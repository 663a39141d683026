//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/source_record.hpp"

#include "httppoll/test/test.hpp"

using namespace httppoll;
using namespace std::string_literals;

namespace {

auto make_partition() -> partition {
  auto result = partition{.url = "https://api.example.com/v1/events"};
  result.metadata.insert_or_assign("region", "eu");
  return result;
}

} // namespace

TEST("partition settings") {
  auto part = make_partition();
  auto xs = to_settings(part);
  CHECK_EQUAL(caf::get_or(xs, "url", ""s), part.url);
  CHECK_EQUAL(caf::get_or(xs, "method", ""s), "GET"s);
  CHECK_EQUAL(caf::get_or(xs, "region", ""s), "eu"s);
  CHECK_EQUAL(to_string(part),
              R"(GET https://api.example.com/v1/events {"region": "eu"})");
  CHECK_EQUAL(fmt::format("{}", partition{.url = "http://x", .method = "POST"}),
              "POST http://x");
}

TEST("partition equality") {
  auto part = make_partition();
  CHECK(part == make_partition());
  auto other = make_partition();
  other.method = "POST";
  CHECK(part != other);
  other = make_partition();
  other.metadata.insert_or_assign("region", "us");
  CHECK(part != other);
}

TEST("assembling records") {
  auto part = make_partition();
  auto off = offset{};
  off.insert_or_assign("cursor", "abc");
  auto items = std::vector<item>{item{"first"s}, item{2}, item{}};
  auto records = assemble("events", part, off, std::move(items));
  REQUIRE_EQUAL(records.size(), 3u);
  CHECK_EQUAL(records[0].value, item{"first"s});
  CHECK_EQUAL(records[1].value, item{2});
  CHECK(caf::holds_alternative<caf::none_t>(records[2].value));
  for (const auto& record : records) {
    CHECK_EQUAL(record.topic, "events"s);
    CHECK(record.source_partition == part);
    CHECK_EQUAL(record.source_offset, off);
    CHECK(not record.key);
    REQUIRE_EQUAL(record.headers.size(), 1u);
    const auto* source = record.header("http.source");
    REQUIRE(source);
    CHECK_EQUAL(source->value, part.url);
    CHECK(record.header("HTTP.SOURCE") == nullptr);
  }
}

TEST("assembling no records") {
  CHECK(assemble("events", make_partition(), offset{}, {}).empty());
}

TEST("printing records") {
  auto off = offset{};
  off.insert_or_assign("page", 2);
  auto records = assemble("t", partition{.url = "http://x"}, off,
                          {item{"v"s}});
  REQUIRE_EQUAL(records.size(), 1u);
  CHECK_EQUAL(to_json(records[0]),
              R"({"headers": {"http.source": "http://x"}, "key": null, )"
              R"("offset": {"page": 2}, )"
              R"("partition": {"method": "GET", "url": "http://x"}, )"
              R"("topic": "t", "value": "v"})");
}
