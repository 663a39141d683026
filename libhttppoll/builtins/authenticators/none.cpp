//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/authenticators.hpp"

namespace httppoll {

auto none_authenticator::name() const -> std::string {
  return "none";
}

auto none_authenticator::configure(const caf::settings&) -> caf::error {
  return {};
}

auto none_authenticator::authenticate(http::request&) const -> caf::error {
  return {};
}

} // namespace httppoll

HTTPPOLL_REGISTER_AUTHENTICATOR(httppoll::none_authenticator, "none")
