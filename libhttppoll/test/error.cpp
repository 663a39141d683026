//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/error.hpp"

#include "httppoll/test/test.hpp"

#include <caf/pec.hpp>
#include <caf/sec.hpp>

using namespace std::string_literals;
using namespace httppoll;

TEST("error to_string") {
  auto str = [](auto x) {
    return to_string(x);
  };
  CHECK_EQUAL(str(ec::no_error), "no_error"s);
  CHECK_EQUAL(str(ec::unspecified), "unspecified"s);
  CHECK_EQUAL(str(ec::invalid_configuration), "invalid_configuration"s);
  CHECK_EQUAL(str(ec::invalid_argument), "invalid_argument"s);
  CHECK_EQUAL(str(ec::lookup_error), "lookup_error"s);
  CHECK_EQUAL(str(ec::parse_error), "parse_error"s);
  CHECK_EQUAL(str(ec::transport_error), "transport_error"s);
  CHECK_EQUAL(str(ec::api_client_error), "api_client_error"s);
  CHECK_EQUAL(str(ec::logic_error), "logic_error"s);
  CHECK_EQUAL(str(ec::filesystem_error), "filesystem_error"s);
}

TEST("error from_string") {
  auto x = ec::no_error;
  CHECK(from_string("api_client_error", x));
  CHECK_EQUAL(x, ec::api_client_error);
  CHECK(not from_string("no_such_error", x));
  CHECK_EQUAL(x, ec::api_client_error);
}

TEST("render") {
  CHECK_EQUAL(render(caf::error{}), "");
  CHECK_EQUAL(render(caf::make_error(ec::unspecified)), "unspecified");
  CHECK_EQUAL(render(caf::make_error(ec::parse_error, "msg")),
              "parse_error: msg");
  CHECK_EQUAL(render(caf::make_error(ec::parse_error, "test with", "multiple",
                                     "messages")),
              "parse_error: test with multiple messages");
  CHECK_EQUAL(render(caf::make_error(caf::pec::type_mismatch, "ttt")),
              "type_mismatch: ttt");
  CHECK_EQUAL(render(caf::make_error(caf::sec::unexpected_message, "msg")),
              "unexpected_message: msg");
}

TEST("add context") {
  auto err = caf::make_error(ec::transport_error, "connection refused");
  auto with_context = add_context(err, "GET {} failed", "http://localhost");
  CHECK_EQUAL(with_context, ec::transport_error);
  CHECK_EQUAL(render(with_context),
              "transport_error: GET http://localhost failed: connection "
              "refused");
  CHECK(not add_context(caf::error{}, "nothing"));
  CHECK_EQUAL(render(add_context(caf::make_error(ec::lookup_error), "key")),
              "lookup_error: key");
}
