//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/http_client.hpp"

#include "httppoll/detail/assert.hpp"
#include "httppoll/logger.hpp"

#include <curl/curl.h>

#include <mutex>

namespace httppoll {

namespace {

auto global_init() -> caf::error {
  static auto flag = std::once_flag{};
  static auto code = CURLE_OK;
  std::call_once(flag, [] {
    code = curl_global_init(CURL_GLOBAL_DEFAULT);
  });
  return to_error(static_cast<curl::easy::code>(code));
}

} // namespace

curl_http_client::curl_http_client(transfer_options options,
                                   std::shared_ptr<const authenticator> auth)
  : options_{std::move(options)}, authenticator_{std::move(auth)} {
  HTTPPOLL_ASSERT(authenticator_ != nullptr);
}

auto curl_http_client::execute(http::request req) const
  -> caf::expected<http::response> {
  if (auto err = authenticator_->authenticate(req))
    return add_context(err, "failed to authenticate request to {}", req.uri);
  // Each request gets its own transfer, so that concurrent polls never share
  // an easy handle.
  auto xfer = transfer{options_};
  if (auto err = xfer.prepare(req))
    return add_context(err, "failed to prepare request to {}", req.uri);
  auto response = xfer.perform();
  if (not response)
    return add_context(response.error(), "{} {} failed", req.method, req.uri);
  return response;
}

auto curl_http_client::options() const -> const transfer_options& {
  return options_;
}

auto make_http_client(const caf::settings& cfg,
                      std::shared_ptr<const authenticator> auth)
  -> caf::expected<std::shared_ptr<const http_client>> {
  if (auto err = global_init())
    return add_context(err, "failed to initialize libcurl");
  auto options = make_transfer_options(cfg);
  if (not options)
    return std::move(options.error());
  return std::make_shared<const curl_http_client>(std::move(*options),
                                                  std::move(auth));
}

} // namespace httppoll
