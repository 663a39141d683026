//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/http.hpp"

#include "httppoll/test/test.hpp"

using namespace httppoll;
using namespace std::string_literals;

TEST("case-insensitive header lookup") {
  auto request = http::request{};
  request.headers.push_back({"Content-Type", "application/json"});
  request.headers.push_back({"X-Token", "secret"});
  const auto* header = request.header("content-type");
  REQUIRE(header);
  CHECK_EQUAL(header->value, "application/json");
  header = request.header("X-TOKEN");
  REQUIRE(header);
  CHECK_EQUAL(header->value, "secret");
  CHECK(request.header("Accept") == nullptr);
  CHECK(request.header("Content") == nullptr);
}

TEST("header lookup with non-ASCII names") {
  auto response = http::response{};
  response.headers.push_back({"X-\xff\xe9tag", "1"});
  const auto* header = response.header("x-\xff\xe9TAG");
  REQUIRE(header);
  CHECK_EQUAL(header->value, "1");
  CHECK(response.header("X-\xfe\xe9tag") == nullptr);
  CHECK(response.header("X-\xff\xc9tag") == nullptr);
}

TEST("request defaults") {
  auto request = http::request{};
  CHECK_EQUAL(request.method, "GET");
  CHECK(request.uri.empty());
  CHECK(not request.credentials);
}

TEST("response status") {
  auto response = http::response{};
  response.status_code = 200;
  response.status_text = "OK";
  CHECK(response.is_success());
  CHECK_EQUAL(response.status_line(), "HTTP/1.1 200 OK"s);
  response.status_code = 299;
  CHECK(response.is_success());
  response.status_code = 199;
  CHECK(not response.is_success());
  response.status_code = 301;
  CHECK(not response.is_success());
  response.status_code = 500;
  response.status_text = "Internal Server Error";
  CHECK(not response.is_success());
  CHECK_EQUAL(response.status_line(), "HTTP/1.1 500 Internal Server Error"s);
}

TEST("status line without reason phrase") {
  auto response = http::response{};
  response.version = 2;
  response.status_code = 204;
  CHECK_EQUAL(response.status_line(), "HTTP/2 204"s);
}
