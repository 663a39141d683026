//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/authenticator.hpp"

#include "httppoll/authenticators.hpp"
#include "httppoll/detail/settings.hpp"
#include "httppoll/test/test.hpp"

#include <caf/settings.hpp>

using namespace httppoll;
using namespace std::string_literals;

namespace {

class token_authenticator final : public authenticator {
public:
  auto name() const -> std::string override {
    return "token";
  }

  auto configure(const caf::settings& cfg) -> caf::error override {
    auto token = detail::get_required<std::string>(cfg, "http.auth.token");
    if (not token)
      return std::move(token.error());
    token_ = std::move(*token);
    return {};
  }

  auto authenticate(http::request& req) const -> caf::error override {
    req.headers.push_back({"Authorization", "Bearer " + token_});
    return {};
  }

private:
  std::string token_;
};

auto make_config(std::string type) -> caf::settings {
  auto cfg = caf::settings{};
  caf::put(cfg, "http.auth.type", std::move(type));
  return cfg;
}

auto sign(const authenticator& auth) -> http::request {
  auto req = http::request{};
  req.uri = "http://example.com";
  auto err = auth.authenticate(req);
  REQUIRE(not err);
  return req;
}

} // namespace

HTTPPOLL_REGISTER_AUTHENTICATOR(token_authenticator, "token")

TEST("auth type parsing") {
  CHECK(unbox(parse_auth_type("none")) == auth_type::none);
  CHECK(unbox(parse_auth_type("BASIC")) == auth_type::basic);
  CHECK(unbox(parse_auth_type("Ntlm")) == auth_type::ntlm);
  CHECK(unbox(parse_auth_type("custom")) == auth_type::custom);
  for (auto x : {auth_type::none, auth_type::basic, auth_type::ntlm,
                 auth_type::custom})
    CHECK(unbox(parse_auth_type(to_string(x))) == x);
  CHECK(to_string(auth_type::ntlm) == "ntlm");
  auto unknown = parse_auth_type("kerberos");
  REQUIRE(not unknown);
  CHECK_EQUAL(unknown.error(), ec::invalid_configuration);
}

TEST("no authentication by default") {
  auto auth = unbox(make_authenticator(caf::settings{}));
  CHECK_EQUAL(auth->name(), "none");
  auto req = sign(*auth);
  CHECK(not req.credentials);
  CHECK(req.headers.empty());
}

TEST("basic authentication") {
  auto cfg = make_config("basic");
  caf::put(cfg, "http.auth.username", "alice");
  caf::put(cfg, "http.auth.password", "wonderland");
  auto auth = unbox(make_authenticator(cfg));
  CHECK_EQUAL(auth->name(), "basic");
  auto req = sign(*auth);
  REQUIRE(req.credentials);
  CHECK(req.credentials->auth_scheme == http::credentials::scheme::basic);
  CHECK_EQUAL(req.credentials->username, "alice");
  CHECK_EQUAL(req.credentials->password, "wonderland");
}

TEST("basic authentication without password") {
  auto cfg = make_config("basic");
  caf::put(cfg, "http.auth.username", "alice");
  auto auth = make_authenticator(cfg);
  REQUIRE(not auth);
  CHECK_EQUAL(auth.error(), ec::invalid_configuration);
}

TEST("NTLM authentication with domain") {
  auto cfg = make_config("ntlm");
  caf::put(cfg, "http.auth.username", "bob");
  caf::put(cfg, "http.auth.password", "builder");
  caf::put(cfg, "http.auth.domain", "CORP");
  auto auth = unbox(make_authenticator(cfg));
  CHECK_EQUAL(auth->name(), "ntlm");
  auto req = sign(*auth);
  REQUIRE(req.credentials);
  CHECK(req.credentials->auth_scheme == http::credentials::scheme::ntlm);
  CHECK_EQUAL(req.credentials->username, "CORP\\bob");
  CHECK_EQUAL(req.credentials->password, "builder");
}

TEST("NTLM authentication without domain") {
  auto cfg = make_config("NTLM");
  caf::put(cfg, "http.auth.username", "bob");
  caf::put(cfg, "http.auth.password", "builder");
  auto auth = unbox(make_authenticator(cfg));
  auto req = sign(*auth);
  REQUIRE(req.credentials);
  CHECK_EQUAL(req.credentials->username, "bob");
}

TEST("unknown auth type") {
  auto auth = make_authenticator(make_config("oauth"));
  REQUIRE(not auth);
  CHECK_EQUAL(auth.error(), ec::invalid_configuration);
}

TEST("custom authentication without class") {
  auto auth = make_authenticator(make_config("custom"));
  REQUIRE(not auth);
  CHECK_EQUAL(auth.error(), ec::invalid_configuration);
}

TEST("custom authentication with unknown class") {
  auto cfg = make_config("custom");
  caf::put(cfg, "http.auth.class", "com.example.Missing");
  auto auth = make_authenticator(cfg);
  REQUIRE(not auth);
  CHECK_EQUAL(auth.error(), ec::invalid_configuration);
}

TEST("custom authentication with a factory that yields nothing") {
  CHECK(authenticator_registry().add("broken", [] {
    return std::unique_ptr<authenticator>{};
  }));
  auto cfg = make_config("custom");
  caf::put(cfg, "http.auth.class", "broken");
  auto auth = make_authenticator(cfg);
  REQUIRE(not auth);
  CHECK_EQUAL(auth.error(), ec::invalid_configuration);
}

TEST("custom authentication with registered class") {
  auto cfg = make_config("custom");
  caf::put(cfg, "http.auth.class", "token");
  caf::put(cfg, "http.auth.token", "t0k3n");
  auto auth = unbox(make_authenticator(cfg));
  CHECK_EQUAL(auth->name(), "token");
  auto req = sign(*auth);
  const auto* header = req.header("authorization");
  REQUIRE(header);
  CHECK_EQUAL(header->value, "Bearer t0k3n");
}

TEST("custom authentication that fails to configure") {
  auto cfg = make_config("custom");
  caf::put(cfg, "http.auth.class", "token");
  auto auth = make_authenticator(cfg);
  REQUIRE(not auth);
  CHECK_EQUAL(auth.error(), ec::invalid_configuration);
}

TEST("built-in authenticators are registered") {
  auto& registry = authenticator_registry();
  CHECK(registry.contains("none"));
  CHECK(registry.contains("basic"));
  CHECK(registry.contains("ntlm"));
  CHECK(registry.contains("token"));
}
