//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/authenticator.hpp"
#include "httppoll/data_extractor.hpp"
#include "httppoll/fwd.hpp"
#include "httppoll/http.hpp"
#include "httppoll/http_client.hpp"
#include "httppoll/pollable_api_client.hpp"
#include "httppoll/url_builder.hpp"

#include <memory>
#include <optional>
#include <string>

namespace httppoll {

/// A generic API client that polls a single endpoint.
///
/// The partition URL is the concatenation of `http.server-uri` and
/// `http.endpoint`. A poll builds a request, executes it, validates the
/// response status, extracts items through the data extractor, wraps them into
/// records and computes the next offset.
///
/// Connectors customize a poll by overriding the protected hooks:
/// - `build_request` adds cursors or time ranges from the offset, or skips a
///   poll by returning an empty optional.
/// - `process_response` changes how responses turn into items.
/// - `update_offset` computes the next offset from the response and the
///   records. The result replaces the old offset as a whole.
class http_api_client : public pollable_api_client {
public:
  /// Constructs a client that sends requests through libcurl.
  explicit http_api_client(std::shared_ptr<data_extractor> extractor);

  /// Constructs a client with a custom transport.
  http_api_client(std::shared_ptr<data_extractor> extractor,
                  http_client_factory make_client);

  ~http_api_client() noexcept override;

  auto configure(const caf::settings& cfg) -> caf::error override;

  auto partitions() const -> caf::expected<std::vector<partition>> override;

  auto initial_offset(const partition& part) const -> offset override;

  auto poll(std::string_view topic, const partition& part, offset& off,
            size_t items_to_poll, const std::atomic<bool>& stop) const
    -> caf::expected<std::vector<source_record>> override;

  auto close() -> void override;

  /// Returns the partition URL, or an empty string before configuration.
  auto url() const -> const std::string&;

  /// Returns the HTTP method of the partition.
  auto method() const -> const std::string&;

protected:
  /// Builds the request of a poll. The default sends the partition method to
  /// the partition URL.
  /// @returns An empty optional to skip the poll.
  virtual auto build_request(const partition& part, const offset& off,
                             size_t items_to_poll) const
    -> caf::expected<std::optional<http::request>>;

  /// Builds a request to the partition URL after substituting route
  /// parameters and appending query parameters.
  auto build_request(const partition& part, const route_params& route,
                     const query_params& query) const
    -> caf::expected<std::optional<http::request>>;

  /// Validates a response and extracts its items.
  virtual auto process_response(const partition& part, const offset& off,
                                const http::response& res) const
    -> caf::expected<std::vector<item>>;

  /// Computes the next offset of a partition. The default keeps the offset.
  virtual auto update_offset(std::string_view topic, const partition& part,
                             const offset& off, const http::response& res,
                             const std::vector<source_record>& records) const
    -> caf::expected<offset>;

  /// Returns the configuration passed to `configure`.
  auto config() const -> const caf::settings&;

  /// Returns the data extractor.
  auto extractor() const -> const data_extractor&;

private:
  std::shared_ptr<data_extractor> extractor_;
  http_client_factory make_client_;
  caf::settings config_;
  std::string url_;
  std::string method_;
  std::shared_ptr<const authenticator> authenticator_;
  std::shared_ptr<const http_client> client_;
};

/// Checks that a response has a 2xx status. Otherwise logs the response with
/// the partition and offset and returns an `ec::api_client_error` that
/// contains the status line, the body, the partition and the offset.
auto validate(const http::response& res, const partition& part,
              const offset& off) -> caf::error;

} // namespace httppoll
