//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/authenticator.hpp"

#include <optional>
#include <string>

namespace httppoll {

/// Leaves requests untouched.
class none_authenticator final : public authenticator {
public:
  auto name() const -> std::string override;

  auto configure(const caf::settings& cfg) -> caf::error override;

  auto authenticate(http::request& req) const -> caf::error override;
};

/// Attaches username and password to every request. Requires
/// `http.auth.username` and `http.auth.password`.
class basic_authenticator : public authenticator {
public:
  auto name() const -> std::string override;

  auto configure(const caf::settings& cfg) -> caf::error override;

  auto authenticate(http::request& req) const -> caf::error override;

protected:
  std::string username_;
  std::string password_;
};

/// Like basic authentication, but negotiates NTLM. An optional
/// `http.auth.domain` qualifies the user as `DOMAIN\user`.
class ntlm_authenticator final : public basic_authenticator {
public:
  auto name() const -> std::string override;

  auto configure(const caf::settings& cfg) -> caf::error override;

  auto authenticate(http::request& req) const -> caf::error override;
};

} // namespace httppoll
