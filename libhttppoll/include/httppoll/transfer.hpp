//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/curl.hpp"
#include "httppoll/fwd.hpp"
#include "httppoll/http.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace httppoll {

/// Options for a cURL-based transfer.
/// @relates transfer
struct transfer_options {
  bool verbose = false;
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds connect_timeout{0};
  bool skip_peer_verification = false;
  bool skip_hostname_verification = false;
  std::optional<std::string> proxy;
  std::string user_agent;

  friend auto inspect(auto& f, transfer_options& x) -> bool {
    return f.object(x)
      .pretty_name("httppoll.transfer_options")
      .fields(f.field("verbose", x.verbose), f.field("timeout", x.timeout),
              f.field("connect_timeout", x.connect_timeout),
              f.field("skip_peer_verification", x.skip_peer_verification),
              f.field("skip_host_verification", x.skip_hostname_verification),
              f.field("proxy", x.proxy), f.field("user_agent", x.user_agent));
  }
};

/// Reads the transfer options from the `http.client.*` keys of a settings
/// tree.
/// @relates transfer_options
auto make_transfer_options(const caf::settings& cfg)
  -> caf::expected<transfer_options>;

namespace detail {

/// Parses a status line like `HTTP/1.1 200 OK` into a response.
/// @returns `false` if *line* is not a status line.
auto parse_status_line(std::string_view line, http::response& res) -> bool;

/// Applies one raw header line of a response, as libcurl hands it to the
/// header callback. A status line discards the headers collected so far, so
/// that only the headers of the final response survive interim responses and
/// redirects.
auto parse_header_line(std::string_view line, http::response& res) -> void;

} // namespace detail

/// A cURL-based transfer.
class transfer {
public:
  /// Constructs a transfer.
  explicit transfer(transfer_options opts = {});

  /// Prepares a transfer with an HTTP request.
  /// @note resets the transfer.
  auto prepare(const http::request& req) -> caf::error;

  /// Runs until the current transfer completed and collects the response.
  auto perform() -> caf::expected<http::response>;

  /// Resets all transfer parameters, keeping the underlying connection alive.
  auto reset() -> caf::error;

  /// Returns a reference to the contained handle.
  auto handle() -> curl::easy&;

  transfer_options options;

private:
  curl::easy easy_;
};

} // namespace httppoll
