//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/fwd.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace httppoll::http {

struct header {
  std::string name;
  std::string value;

  friend auto operator==(const header&, const header&) -> bool = default;

  friend auto inspect(auto& f, header& x) -> bool {
    return f.object(x)
      .pretty_name("httppoll.http.header")
      .fields(f.field("name", x.name), f.field("value", x.value));
  }
};

/// Base for HTTP messages.
struct message {
  std::string protocol = "HTTP";
  double version = 1.1;
  std::vector<http::header> headers;
  std::string body;

  /// Looks up a header by name, ignoring case.
  [[nodiscard]] auto header(std::string_view name) -> http::header*;

  /// Looks up a header by name, ignoring case.
  [[nodiscard]] auto header(std::string_view name) const
    -> const http::header*;
};

/// Credentials that the transport attaches to a request.
struct credentials {
  enum class scheme : uint8_t {
    basic,
    ntlm,
  };

  scheme auth_scheme = scheme::basic;
  std::string username;
  std::string password;

  friend auto operator==(const credentials&, const credentials&) -> bool
    = default;
};

/// A HTTP request message.
struct request : message {
  std::string method = "GET";
  std::string uri;
  std::optional<http::credentials> credentials;
};

/// A HTTP response message.
struct response : message {
  uint32_t status_code = 0;
  std::string status_text;

  /// Checks whether the status code is in the 2xx range.
  [[nodiscard]] auto is_success() const -> bool;

  /// Renders the status line, e.g., `HTTP/1.1 404 Not Found`.
  [[nodiscard]] auto status_line() const -> std::string;
};

} // namespace httppoll::http
