//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/fwd.hpp"
#include "httppoll/http.hpp"
#include "httppoll/registry.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace httppoll {

/// The authentication strategies selectable through `http.auth.type`.
enum class auth_type : uint8_t {
  none,
  basic,
  ntlm,
  custom,
};

/// @relates auth_type
auto to_string(auth_type x) -> std::string_view;

/// Parses an authentication type, ignoring case.
/// @relates auth_type
auto parse_auth_type(std::string_view str) -> caf::expected<auth_type>;

/// Signs outgoing requests. An authenticator is configured once and then
/// shared by all polls of a client, so `authenticate` must be thread-safe.
class authenticator {
public:
  virtual ~authenticator() noexcept = default;

  /// Returns the name of the strategy.
  virtual auto name() const -> std::string = 0;

  /// Configures the strategy from the client configuration.
  virtual auto configure(const caf::settings& cfg) -> caf::error = 0;

  /// Applies the strategy to a request.
  virtual auto authenticate(http::request& req) const -> caf::error = 0;
};

/// Returns the registry of authenticators that `http.auth.type: custom`
/// selects from through `http.auth.class`.
auto authenticator_registry() -> registry<authenticator>&;

/// Creates and configures the authenticator selected by `http.auth.type`.
auto make_authenticator(const caf::settings& cfg)
  -> caf::expected<std::shared_ptr<const authenticator>>;

} // namespace httppoll

/// Registers an authenticator type under a name.
#define HTTPPOLL_REGISTER_AUTHENTICATOR(type, name)                            \
  template <class>                                                             \
  struct auto_register_authenticator;                                          \
  template <>                                                                  \
  struct auto_register_authenticator<type> {                                   \
    auto_register_authenticator() {                                            \
      static_cast<void>(flag);                                                 \
    }                                                                          \
    static auto init() -> bool {                                               \
      return ::httppoll::authenticator_registry().add(                         \
        (name), []() -> std::unique_ptr<::httppoll::authenticator> {           \
          return std::make_unique<type>();                                     \
        });                                                                    \
    }                                                                          \
    inline static auto flag = init();                                          \
  };
