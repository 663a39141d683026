//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/url_builder.hpp"

#include "httppoll/curl.hpp"
#include "httppoll/error.hpp"

#include <fmt/format.h>

namespace httppoll {

url_builder::url_builder(std::string base) : url_{std::move(base)} {
}

auto url_builder::route_param(std::string_view name, std::string_view value)
  -> url_builder& {
  if (error_)
    return *this;
  auto placeholder = fmt::format("{{{}}}", name);
  auto escaped = curl::escape(value);
  auto found = false;
  for (auto i = url_.find(placeholder); i != std::string::npos;
       i = url_.find(placeholder, i + escaped.size())) {
    url_.replace(i, placeholder.size(), escaped);
    found = true;
  }
  if (not found)
    error_ = caf::make_error(ec::invalid_argument,
                             fmt::format("no placeholder {} in URL {}",
                                         placeholder, url_));
  return *this;
}

auto url_builder::route_params(const httppoll::route_params& params)
  -> url_builder& {
  for (const auto& [name, value] : params)
    route_param(name, value);
  return *this;
}

auto url_builder::query_param(std::string_view key, std::string_view value)
  -> url_builder& {
  query_.emplace_back(curl::escape(key), curl::escape(value));
  return *this;
}

auto url_builder::query_params(const httppoll::query_params& params)
  -> url_builder& {
  for (const auto& [key, value] : params)
    query_param(key, value);
  return *this;
}

auto url_builder::query_string() const -> std::string {
  auto result = std::string{};
  for (const auto& [key, value] : query_) {
    if (not result.empty())
      result += '&';
    result += key;
    result += '=';
    result += value;
  }
  return result;
}

auto url_builder::build() const -> caf::expected<std::string> {
  if (error_)
    return error_;
  auto result = url_;
  if (not query_.empty()) {
    auto fragment = std::string{};
    if (auto i = result.find('#'); i != std::string::npos) {
      fragment = result.substr(i);
      result.erase(i);
    }
    result += result.find('?') == std::string::npos ? '?' : '&';
    result += query_string();
    result += fragment;
  }
  // We only use libcurl to validate the result and keep the URL as given,
  // because libcurl would normalize it.
  auto validator = curl::url{};
  if (auto err = to_error(validator.set(result)))
    return add_context(err, "invalid URL '{}'", result);
  return result;
}

auto join_url(std::string_view server_uri, std::string_view endpoint)
  -> std::string {
  while (server_uri.ends_with('/'))
    server_uri.remove_suffix(1);
  while (endpoint.starts_with('/'))
    endpoint.remove_prefix(1);
  if (endpoint.empty())
    return std::string{server_uri};
  return fmt::format("{}/{}", server_uri, endpoint);
}

} // namespace httppoll
