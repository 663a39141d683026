//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/authenticators.hpp"
#include "httppoll/detail/settings.hpp"

#include <fmt/format.h>

namespace httppoll {

auto ntlm_authenticator::name() const -> std::string {
  return "ntlm";
}

auto ntlm_authenticator::configure(const caf::settings& cfg) -> caf::error {
  if (auto err = basic_authenticator::configure(cfg))
    return err;
  auto domain = detail::get_option<std::string>(cfg, "http.auth.domain");
  if (not domain)
    return std::move(domain.error());
  if (*domain and not (*domain)->empty())
    username_ = fmt::format("{}\\{}", **domain, username_);
  return {};
}

auto ntlm_authenticator::authenticate(http::request& req) const
  -> caf::error {
  req.credentials = http::credentials{
    .auth_scheme = http::credentials::scheme::ntlm,
    .username = username_,
    .password = password_,
  };
  return {};
}

} // namespace httppoll

HTTPPOLL_REGISTER_AUTHENTICATOR(httppoll::ntlm_authenticator, "ntlm")
