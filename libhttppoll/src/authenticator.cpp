//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/authenticator.hpp"

#include "httppoll/authenticators.hpp"
#include "httppoll/defaults.hpp"
#include "httppoll/detail/assert.hpp"
#include "httppoll/detail/settings.hpp"
#include "httppoll/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace httppoll {

namespace {

using constructor = auto (*)() -> std::unique_ptr<authenticator>;

template <class T>
auto construct() -> std::unique_ptr<authenticator> {
  return std::make_unique<T>();
}

constexpr auto builtin_authenticators
  = std::array<std::pair<auth_type, constructor>, 3>{{
    {auth_type::none, &construct<none_authenticator>},
    {auth_type::basic, &construct<basic_authenticator>},
    {auth_type::ntlm, &construct<ntlm_authenticator>},
  }};

auto make_custom_authenticator(const caf::settings& cfg)
  -> caf::expected<std::unique_ptr<authenticator>> {
  auto name = detail::get_required<std::string>(cfg, "http.auth.class");
  if (not name)
    return add_context(name.error(), "custom authentication requires a class");
  auto result = authenticator_registry().make(*name);
  if (not result)
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("failed to load authenticator '{}': {}",
                                       *name, render(result.error())));
  return result;
}

} // namespace

auto to_string(auth_type x) -> std::string_view {
  switch (x) {
    case auth_type::none:
      return "none";
    case auth_type::basic:
      return "basic";
    case auth_type::ntlm:
      return "ntlm";
    case auth_type::custom:
      return "custom";
  }
  HTTPPOLL_UNREACHABLE();
}

auto parse_auth_type(std::string_view str) -> caf::expected<auth_type> {
  auto lower = std::string{str};
  std::transform(lower.begin(), lower.end(), lower.begin(), [](auto c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  for (auto x :
       {auth_type::none, auth_type::basic, auth_type::ntlm, auth_type::custom})
    if (lower == to_string(x))
      return x;
  return caf::make_error(ec::invalid_configuration,
                         fmt::format("unknown authentication type '{}'", str));
}

auto authenticator_registry() -> registry<authenticator>& {
  static auto result = registry<authenticator>{};
  return result;
}

auto make_authenticator(const caf::settings& cfg)
  -> caf::expected<std::shared_ptr<const authenticator>> {
  auto tag = detail::get_option<std::string>(cfg, "http.auth.type");
  if (not tag)
    return std::move(tag.error());
  auto type
    = parse_auth_type(tag->value_or(std::string{defaults::http::auth_type}));
  if (not type)
    return std::move(type.error());
  auto result = std::unique_ptr<authenticator>{};
  if (*type == auth_type::custom) {
    auto custom = make_custom_authenticator(cfg);
    if (not custom)
      return std::move(custom.error());
    result = std::move(*custom);
  } else {
    auto it = std::find_if(builtin_authenticators.begin(),
                           builtin_authenticators.end(), [&](const auto& x) {
                             return x.first == *type;
                           });
    HTTPPOLL_ASSERT(it != builtin_authenticators.end());
    result = it->second();
  }
  if (auto err = result->configure(cfg))
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("failed to configure {} authenticator: "
                                       "{}",
                                       result->name(), render(err)));
  HTTPPOLL_VERBOSE("using {} authentication", result->name());
  return std::shared_ptr<const authenticator>{std::move(result)};
}

} // namespace httppoll
