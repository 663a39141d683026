//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/authenticators.hpp"
#include "httppoll/detail/settings.hpp"

namespace httppoll {

auto basic_authenticator::name() const -> std::string {
  return "basic";
}

auto basic_authenticator::configure(const caf::settings& cfg) -> caf::error {
  auto username = detail::get_required<std::string>(cfg, "http.auth.username");
  if (not username)
    return std::move(username.error());
  auto password = detail::get_required<std::string>(cfg, "http.auth.password");
  if (not password)
    return std::move(password.error());
  if (username->empty())
    return caf::make_error(ec::invalid_configuration,
                           "option 'http.auth.username' must not be empty");
  username_ = std::move(*username);
  password_ = std::move(*password);
  return {};
}

auto basic_authenticator::authenticate(http::request& req) const
  -> caf::error {
  req.credentials = http::credentials{
    .auth_scheme = http::credentials::scheme::basic,
    .username = username_,
    .password = password_,
  };
  return {};
}

} // namespace httppoll

HTTPPOLL_REGISTER_AUTHENTICATOR(httppoll::basic_authenticator, "basic")
