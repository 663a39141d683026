//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/json.hpp"

#include "httppoll/data_extractor.hpp"
#include "httppoll/json_extractor.hpp"
#include "httppoll/test/test.hpp"

using namespace httppoll;
using namespace std::string_literals;

namespace {

auto respond(std::string body) -> http::response {
  auto result = http::response{};
  result.status_code = 200;
  result.status_text = "OK";
  result.body = std::move(body);
  return result;
}

auto extract(const json_extractor& extractor, std::string body)
  -> caf::expected<std::vector<item>> {
  auto part = partition{.url = "http://example.com/items"};
  return extractor.extract(part, offset{}, respond(std::move(body)));
}

} // namespace

TEST("parsing JSON") {
  auto x = unbox(from_json(R"({"a": 1, "b": [true, null, 2.5], "c": "x"})"));
  const auto* object = caf::get_if<caf::settings>(&x);
  REQUIRE(object);
  CHECK_EQUAL(caf::get_or(*object, "a", int64_t{0}), 1);
  const auto* list = caf::get_if<caf::config_value::list>(&(*object)["b"]);
  REQUIRE(list);
  REQUIRE_EQUAL(list->size(), 3u);
  CHECK_EQUAL((*list)[0], item{true});
  CHECK(caf::holds_alternative<caf::none_t>((*list)[1]));
  CHECK_EQUAL((*list)[2], item{2.5});
  CHECK_EQUAL(caf::get_or(*object, "c", ""s), "x"s);
}

TEST("parsing invalid JSON") {
  auto x = from_json("{\"a\": ");
  REQUIRE(not x);
  CHECK_EQUAL(x.error(), ec::parse_error);
}

TEST("printing JSON") {
  CHECK_EQUAL(to_json(item{}), "null");
  CHECK_EQUAL(to_json(item{42}), "42");
  CHECK_EQUAL(to_json(item{false}), "false");
  CHECK_EQUAL(to_json(item{"a \"quoted\"\nline"s}),
              R"("a \"quoted\"\nline")");
  auto xs = caf::config_value::list{item{1}, item{"two"s}};
  CHECK_EQUAL(to_json(item{xs}), R"([1, "two"])");
  auto dict = caf::settings{};
  dict.insert_or_assign("b", item{1});
  dict.insert_or_assign("a", item{xs});
  CHECK_EQUAL(to_json(dict), R"({"a": [1, "two"], "b": 1})");
}

TEST("JSON printing and parsing agree") {
  auto text = R"({"cursor": "abc", "page": 3, "ratio": 0.5})"s;
  CHECK_EQUAL(to_json(unbox(from_json(text))), text);
}

TEST("extracting array elements") {
  auto extractor = json_extractor{};
  REQUIRE(not extractor.configure(caf::settings{}));
  auto items = unbox(extract(extractor, R"(["a", "b"])"));
  REQUIRE_EQUAL(items.size(), 2u);
  CHECK_EQUAL(items[0], item{"a"s});
  CHECK_EQUAL(items[1], item{"b"s});
}

TEST("extracting a single value") {
  auto extractor = json_extractor{};
  auto items = unbox(extract(extractor, R"({"id": 1})"));
  REQUIRE_EQUAL(items.size(), 1u);
  CHECK_EQUAL(to_json(items[0]), R"({"id": 1})");
}

TEST("extracting nothing") {
  auto extractor = json_extractor{};
  CHECK(unbox(extract(extractor, "")).empty());
  CHECK(unbox(extract(extractor, " \r\n")).empty());
  CHECK(unbox(extract(extractor, "null")).empty());
  CHECK(unbox(extract(extractor, "[]")).empty());
}

TEST("extracting along a path") {
  auto cfg = caf::settings{};
  caf::put(cfg, "http.response.json-path", "data.items");
  auto extractor = json_extractor{};
  REQUIRE(not extractor.configure(cfg));
  REQUIRE_EQUAL(extractor.path().size(), 2u);
  auto body = R"({"data": {"items": [{"id": 1}, {"id": 2}], "next": null}})";
  auto items = unbox(extract(extractor, body));
  REQUIRE_EQUAL(items.size(), 2u);
  CHECK_EQUAL(to_json(items[1]), R"({"id": 2})");
  auto missing = extract(extractor, R"({"data": {}})");
  REQUIRE(not missing);
  CHECK_EQUAL(missing.error(), ec::parse_error);
  auto not_an_object = extract(extractor, R"({"data": [1]})");
  CHECK(not not_an_object);
}

TEST("invalid paths") {
  auto extractor = json_extractor{};
  for (auto path : {"a..b", ".a", "a."}) {
    auto cfg = caf::settings{};
    caf::put(cfg, "http.response.json-path", path);
    auto err = extractor.configure(cfg);
    CHECK_EQUAL(err, ec::invalid_configuration);
  }
}

TEST("extracting from malformed JSON") {
  auto extractor = json_extractor{};
  auto items = extract(extractor, "{");
  REQUIRE(not items);
  CHECK_EQUAL(items.error(), ec::parse_error);
}

TEST("the JSON extractor is registered") {
  auto extractor = unbox(extractor_registry().make("json"));
  CHECK_EQUAL(extractor->name(), "json");
  auto missing = extractor_registry().make("xml");
  REQUIRE(not missing);
  CHECK_EQUAL(missing.error(), ec::lookup_error);
}
