//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/authenticator.hpp"
#include "httppoll/fwd.hpp"
#include "httppoll/http.hpp"
#include "httppoll/transfer.hpp"

#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <functional>
#include <memory>

namespace httppoll {

/// Executes HTTP requests synchronously. Implementations must be safe for
/// concurrent use, because polls of distinct partitions share one client.
class http_client {
public:
  virtual ~http_client() noexcept = default;

  /// Sends a request and blocks until the response arrived.
  virtual auto execute(http::request req) const
    -> caf::expected<http::response> = 0;
};

/// An HTTP client on top of libcurl that signs every request with an
/// authenticator before sending it.
class curl_http_client final : public http_client {
public:
  curl_http_client(transfer_options options,
                   std::shared_ptr<const authenticator> auth);

  auto execute(http::request req) const
    -> caf::expected<http::response> override;

  auto options() const -> const transfer_options&;

private:
  transfer_options options_;
  std::shared_ptr<const authenticator> authenticator_;
};

/// Creates the HTTP client of an API client.
using http_client_factory
  = std::function<auto(const caf::settings&,
                       std::shared_ptr<const authenticator>)
                    ->caf::expected<std::shared_ptr<const http_client>>>;

/// Creates a `curl_http_client` from the `http.client.*` options.
auto make_http_client(const caf::settings& cfg,
                      std::shared_ptr<const authenticator> auth)
  -> caf::expected<std::shared_ptr<const http_client>>;

} // namespace httppoll
