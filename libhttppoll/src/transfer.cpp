//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/transfer.hpp"

#include "httppoll/defaults.hpp"
#include "httppoll/detail/assert.hpp"
#include "httppoll/detail/settings.hpp"
#include "httppoll/logger.hpp"

#include <caf/detail/scope_guard.hpp>

#include <charconv>
#include <string_view>

namespace httppoll {

namespace {

auto trim(std::string_view str) -> std::string_view {
  auto is_space = [](char c) {
    return c == ' ' or c == '\t' or c == '\r' or c == '\n';
  };
  while (not str.empty() and is_space(str.front()))
    str.remove_prefix(1);
  while (not str.empty() and is_space(str.back()))
    str.remove_suffix(1);
  return str;
}

} // namespace

namespace detail {

auto parse_status_line(std::string_view line, http::response& res) -> bool {
  if (not line.starts_with("HTTP/"))
    return false;
  res.protocol = "HTTP";
  line.remove_prefix(5);
  auto space = line.find(' ');
  auto version = line.substr(0, space);
  auto parsed_version = 0.0;
  if (std::from_chars(version.data(), version.data() + version.size(),
                      parsed_version)
        .ec
      == std::errc{})
    res.version = parsed_version;
  if (space == std::string_view::npos)
    return true;
  line = line.substr(space + 1);
  space = line.find(' ');
  auto code = line.substr(0, space);
  auto status_code = uint32_t{0};
  if (std::from_chars(code.data(), code.data() + code.size(), status_code).ec
      == std::errc{})
    res.status_code = status_code;
  res.status_text = space == std::string_view::npos
                      ? std::string{}
                      : std::string{trim(line.substr(space + 1))};
  return true;
}

auto parse_header_line(std::string_view line, http::response& res) -> void {
  if (parse_status_line(line, res)) {
    res.headers.clear();
    return;
  }
  auto colon = line.find(':');
  if (colon == std::string_view::npos)
    return;
  res.headers.push_back({
    .name = std::string{trim(line.substr(0, colon))},
    .value = std::string{trim(line.substr(colon + 1))},
  });
}

} // namespace detail

auto make_transfer_options(const caf::settings& cfg)
  -> caf::expected<transfer_options> {
  auto result = transfer_options{};
  result.user_agent = std::string{defaults::http::user_agent};
  auto read_flag = [&](std::string_view key, bool& out) -> caf::error {
    auto value = detail::get_option<bool>(cfg, key);
    if (not value)
      return std::move(value.error());
    if (*value)
      out = **value;
    return {};
  };
  auto read_ms = [&](std::string_view key,
                     std::chrono::milliseconds& out) -> caf::error {
    auto value = detail::get_option<int64_t>(cfg, key);
    if (not value)
      return std::move(value.error());
    if (not *value)
      return {};
    if (**value < 0)
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("option '{}' must not be negative",
                                         key));
    out = std::chrono::milliseconds{**value};
    return {};
  };
  if (auto err = read_flag("http.client.verbose", result.verbose))
    return err;
  if (auto err = read_ms("http.client.timeout-ms", result.timeout))
    return err;
  if (auto err
      = read_ms("http.client.connect-timeout-ms", result.connect_timeout))
    return err;
  if (auto err = read_flag("http.client.skip-peer-verification",
                           result.skip_peer_verification))
    return err;
  if (auto err = read_flag("http.client.skip-hostname-verification",
                           result.skip_hostname_verification))
    return err;
  auto proxy = detail::get_option<std::string>(cfg, "http.client.proxy");
  if (not proxy)
    return std::move(proxy.error());
  result.proxy = std::move(*proxy);
  auto user_agent
    = detail::get_option<std::string>(cfg, "http.client.user-agent");
  if (not user_agent)
    return std::move(user_agent.error());
  if (*user_agent)
    result.user_agent = std::move(**user_agent);
  return result;
}

transfer::transfer(transfer_options opts) : options{std::move(opts)} {
}

auto transfer::prepare(const http::request& req) -> caf::error {
  HTTPPOLL_DEBUG("preparing HTTP request");
  if (auto err = reset()) {
    return err;
  }
  auto& easy = handle();
  // Enable all supported built-in compressions by setting the empty string.
  // This can always be overriden by manually setting the Accept-Encoding
  // header.
  if (auto err = to_error(easy.set(CURLOPT_ACCEPT_ENCODING, ""))) {
    return err;
  }
  // Ensure to follow HTTP redirects.
  if (auto err = to_error(easy.set(CURLOPT_FOLLOWLOCATION, 1))) {
    return err;
  }
  HTTPPOLL_DEBUG("setting URL: {}", req.uri);
  if (auto err = to_error(easy.set(CURLOPT_URL, req.uri))) {
    return err;
  }
  // Set method.
  HTTPPOLL_DEBUG("setting method: {}", req.method);
  if (req.method == "GET") {
    if (auto err = to_error(easy.set(CURLOPT_HTTPGET, 1))) {
      return err;
    }
  } else if (req.method == "HEAD") {
    if (auto err = to_error(easy.set(CURLOPT_NOBODY, 1))) {
      return err;
    }
  } else if (req.method == "POST") {
    if (auto err = to_error(easy.set(CURLOPT_POST, 1))) {
      return err;
    }
    // We set the POST body size here, even if the request body is empty, i.e.,
    // the size is 0. This allows us to send POST requests that are empty, which
    // is actually a valid scenario.
    auto size = static_cast<long>(req.body.size());
    HTTPPOLL_DEBUG("setting {}-byte POST body", size);
    if (auto err = to_error(easy.set_postfieldsize(size))) {
      return err;
    }
  } else if (not req.method.empty()) {
    if (auto err = to_error(easy.set(CURLOPT_CUSTOMREQUEST, req.method))) {
      return err;
    }
  }
  // Set the body.
  if (not req.body.empty()) {
    if (req.method == "GET" or req.method == "HEAD") {
      HTTPPOLL_WARN("ignoring unexpected request body with HTTP {} method",
                    req.method);
    } else {
      auto size = static_cast<long>(req.body.size());
      if (auto err = to_error(easy.set_postfieldsize(size))) {
        return err;
      }
      // Setting body data via CURLOPT_COPYPOSTFIELDS implicitly sets the
      // Content-Type header to 'application/x-www-form-urlencoded' unless we
      // provide a Content-Type header that overrides it.
      if (auto err = to_error(easy.set(CURLOPT_COPYPOSTFIELDS, req.body))) {
        return err;
      }
    }
  }
  // Set credentials.
  if (req.credentials) {
    auto scheme = req.credentials->auth_scheme == http::credentials::scheme::ntlm
                    ? CURLAUTH_NTLM
                    : CURLAUTH_BASIC;
    HTTPPOLL_DEBUG("setting {} credentials for user {}",
                   scheme == CURLAUTH_NTLM ? "NTLM" : "basic",
                   req.credentials->username);
    if (auto err = to_error(
          easy.set(CURLOPT_HTTPAUTH, static_cast<long>(scheme)))) {
      return add_context(err, "failed to set authentication scheme");
    }
    if (auto err
        = to_error(easy.set(CURLOPT_USERNAME, req.credentials->username))) {
      return add_context(err, "failed to set user name");
    }
    if (auto err
        = to_error(easy.set(CURLOPT_PASSWORD, req.credentials->password))) {
      return add_context(err, "failed to set password");
    }
  }
  // Add headers
  auto set_header = [&](std::string_view name, std::string_view value) {
    HTTPPOLL_DEBUG("setting HTTP header {}: {}", name, value);
    auto code = easy.set_http_header(name, value);
    HTTPPOLL_ASSERT(code == curl::easy::code::ok);
  };
  // Add default headers.
  if (req.header("Accept") == nullptr) {
    set_header("Accept", "*/*");
  }
  if (req.header("User-Agent") == nullptr) {
    set_header("User-Agent", options.user_agent);
  }
  // Set user-provided headers.
  for (const auto& [name, value] : req.headers) {
    set_header(name, value);
  }
  return {};
}

auto transfer::perform() -> caf::expected<http::response> {
  auto result = http::response{};
  auto on_body = [&result](std::span<const std::byte> buffer) {
    const auto* ptr = reinterpret_cast<const char*>(buffer.data());
    result.body.append(ptr, buffer.size());
  };
  auto on_header = [&result](std::span<const std::byte> buffer) {
    const auto* ptr = reinterpret_cast<const char*>(buffer.data());
    detail::parse_header_line(std::string_view{ptr, buffer.size()}, result);
  };
  auto code = easy_.set(on_body);
  HTTPPOLL_ASSERT(code == curl::easy::code::ok);
  code = easy_.set_header_callback(on_header);
  HTTPPOLL_ASSERT(code == curl::easy::code::ok);
  code = easy_.perform();
  // The callbacks reference the local response, so they must not outlive
  // this function.
  auto guard = caf::detail::make_scope_guard([this]() noexcept {
    easy_.reset();
  });
  if (code != curl::easy::code::ok) {
    return to_error(code);
  }
  auto [info_code, response_code]
    = easy_.get<curl::easy::info::response_code>();
  if (info_code == curl::easy::code::ok and response_code > 0) {
    result.status_code = static_cast<uint32_t>(response_code);
  }
  HTTPPOLL_DEBUG("received response with status {} and {}-byte body",
                 result.status_code, result.body.size());
  return result;
}

auto transfer::reset() -> caf::error {
  HTTPPOLL_TRACE("resetting transfer");
  easy_.reset();
  // Signals are not thread-safe, and we run transfers on many threads.
  auto code = easy_.set(CURLOPT_NOSIGNAL, 1);
  HTTPPOLL_ASSERT(code == curl::easy::code::ok);
  if (options.verbose) {
    code = easy_.set(CURLOPT_VERBOSE, 1);
    HTTPPOLL_ASSERT(code == curl::easy::code::ok);
  }
  if (options.timeout.count() > 0) {
    code = easy_.set(CURLOPT_TIMEOUT_MS,
                     static_cast<long>(options.timeout.count()));
    HTTPPOLL_ASSERT(code == curl::easy::code::ok);
  }
  if (options.connect_timeout.count() > 0) {
    code = easy_.set(CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options.connect_timeout.count()));
    HTTPPOLL_ASSERT(code == curl::easy::code::ok);
  }
  if (options.skip_peer_verification) {
    code = easy_.set(CURLOPT_SSL_VERIFYPEER, 0);
    HTTPPOLL_ASSERT(code == curl::easy::code::ok);
  }
  if (options.skip_hostname_verification) {
    code = easy_.set(CURLOPT_SSL_VERIFYHOST, 0);
    HTTPPOLL_ASSERT(code == curl::easy::code::ok);
  }
  if (options.proxy) {
    if (auto err = to_error(easy_.set(CURLOPT_PROXY, *options.proxy))) {
      return add_context(err, "failed to set proxy {}", *options.proxy);
    }
  }
  return {};
}

auto transfer::handle() -> curl::easy& {
  return easy_;
}

} // namespace httppoll
