//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/transfer.hpp"

#include "httppoll/test/test.hpp"

#include <algorithm>
#include <string_view>
#include <vector>

using namespace httppoll;
using namespace std::chrono_literals;
using namespace std::string_literals;

TEST("default transfer options") {
  auto opts = unbox(make_transfer_options(caf::settings{}));
  CHECK(not opts.verbose);
  CHECK(opts.timeout == 0ms);
  CHECK(opts.connect_timeout == 0ms);
  CHECK(not opts.skip_peer_verification);
  CHECK(not opts.proxy);
  CHECK(opts.user_agent.starts_with("httppoll/"));
}

TEST("configured transfer options") {
  auto cfg = caf::settings{};
  caf::put(cfg, "http.client.verbose", true);
  caf::put(cfg, "http.client.timeout-ms", 1500);
  caf::put(cfg, "http.client.connect-timeout-ms", 200);
  caf::put(cfg, "http.client.skip-hostname-verification", true);
  caf::put(cfg, "http.client.proxy", "http://proxy:3128");
  caf::put(cfg, "http.client.user-agent", "poller");
  auto opts = unbox(make_transfer_options(cfg));
  CHECK(opts.verbose);
  CHECK(opts.timeout == 1500ms);
  CHECK(opts.connect_timeout == 200ms);
  CHECK(opts.skip_hostname_verification);
  CHECK(not opts.skip_peer_verification);
  CHECK_EQUAL(opts.proxy.value_or(""), "http://proxy:3128"s);
  CHECK_EQUAL(opts.user_agent, "poller"s);
}

TEST("invalid transfer options") {
  auto cfg = caf::settings{};
  caf::put(cfg, "http.client.timeout-ms", -1);
  auto opts = make_transfer_options(cfg);
  REQUIRE(not opts);
  CHECK_EQUAL(opts.error(), ec::invalid_configuration);
  cfg = caf::settings{};
  caf::put(cfg, "http.client.verbose", "sometimes");
  opts = make_transfer_options(cfg);
  REQUIRE(not opts);
  CHECK_EQUAL(opts.error(), ec::invalid_configuration);
}

TEST("preparing requests") {
  auto tx = transfer{};
  auto req = http::request{};
  req.method = "POST";
  req.uri = "http://localhost/items";
  req.body = R"({"limit": 10})";
  req.credentials = http::credentials{
    .auth_scheme = http::credentials::scheme::ntlm,
    .username = "CORP\\alice",
    .password = "secret",
  };
  req.headers.push_back({"Content-Type", "application/json"});
  CHECK(not tx.prepare(req));
  auto headers = tx.handle().headers();
  auto has = [&](std::string_view name, std::string_view value) {
    return std::find(headers.begin(), headers.end(),
                     std::pair{std::string{name}, std::string{value}})
           != headers.end();
  };
  CHECK(has("Content-Type", "application/json"));
  CHECK(has("Accept", "*/*"));
  CHECK(has("User-Agent", tx.options.user_agent));
}

TEST("preparing requests overrides default headers") {
  auto tx = transfer{};
  auto req = http::request{};
  req.uri = "http://localhost/items";
  req.headers.push_back({"accept", "application/json"});
  CHECK(not tx.prepare(req));
  auto headers = tx.handle().headers();
  REQUIRE_EQUAL(headers.size(), 2u);
  CHECK_EQUAL(headers[0].first, "User-Agent"s);
  CHECK_EQUAL(headers[1].second, "application/json"s);
}

TEST("parsing status lines") {
  auto res = http::response{};
  CHECK(detail::parse_status_line("HTTP/1.1 404 Not Found\r\n", res));
  CHECK_EQUAL(res.protocol, "HTTP"s);
  CHECK_EQUAL(res.version, 1.1);
  CHECK_EQUAL(res.status_code, 404u);
  CHECK_EQUAL(res.status_text, "Not Found"s);
  CHECK(detail::parse_status_line("HTTP/2 200\r\n", res));
  CHECK_EQUAL(res.version, 2.0);
  CHECK_EQUAL(res.status_code, 200u);
  CHECK(res.status_text.empty());
  CHECK_EQUAL(res.status_line(), "HTTP/2 200"s);
  CHECK(not detail::parse_status_line("Content-Type: text/plain\r\n", res));
  CHECK(not detail::parse_status_line("\r\n", res));
  CHECK_EQUAL(res.status_code, 200u);
}

TEST("parsing header lines of interim responses") {
  auto res = http::response{};
  auto lines = std::vector<std::string_view>{
    "HTTP/1.1 100 Continue\r\n",
    "X-Interim: 1\r\n",
    "\r\n",
    "HTTP/1.1 200 OK\r\n",
    "Content-Type: application/json\r\n",
    "Location:  http://api.example.com/next \r\n",
    "\r\n",
  };
  for (auto line : lines)
    detail::parse_header_line(line, res);
  CHECK_EQUAL(res.status_code, 200u);
  CHECK_EQUAL(res.status_text, "OK"s);
  REQUIRE_EQUAL(res.headers.size(), 2u);
  CHECK(res.header("X-Interim") == nullptr);
  CHECK_EQUAL(res.headers[0].name, "Content-Type"s);
  CHECK_EQUAL(res.headers[0].value, "application/json"s);
  CHECK_EQUAL(res.headers[1].value, "http://api.example.com/next"s);
}
