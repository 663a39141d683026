//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/fwd.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace httppoll {

/// Route parameters substitute `{name}` placeholders in the path of a URL.
using route_params = std::map<std::string, std::string, std::less<>>;

/// Query parameters are appended to a URL as `key=value` pairs.
using query_params = std::map<std::string, std::string, std::less<>>;

/// Assembles a URL from a template, route parameters and query parameters.
/// All parameter values are URL-encoded.
///
/// @code
/// auto url = url_builder{"http://example.com/users/{id}"}
///              .route_param("id", "42")
///              .query_param("fields", "name,mail")
///              .build();
/// // http://example.com/users/42?fields=name%2Cmail
/// @endcode
class url_builder {
public:
  explicit url_builder(std::string base);

  /// Replaces every `{name}` placeholder with the encoded value.
  auto route_param(std::string_view name, std::string_view value)
    -> url_builder&;

  /// Substitutes all given route parameters.
  auto route_params(const httppoll::route_params& params) -> url_builder&;

  /// Appends an encoded query parameter.
  auto query_param(std::string_view key, std::string_view value)
    -> url_builder&;

  /// Appends all given query parameters.
  auto query_params(const httppoll::query_params& params) -> url_builder&;

  /// Returns the query string without the leading `?`.
  auto query_string() const -> std::string;

  /// Validates and returns the URL.
  auto build() const -> caf::expected<std::string>;

private:
  std::string url_;
  std::vector<std::pair<std::string, std::string>> query_;
  caf::error error_;
};

/// Concatenates a server URI and an endpoint path with exactly one slash
/// between them.
auto join_url(std::string_view server_uri, std::string_view endpoint)
  -> std::string;

} // namespace httppoll
