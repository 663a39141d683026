//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/http_api_client.hpp"

#include "httppoll/defaults.hpp"
#include "httppoll/detail/assert.hpp"
#include "httppoll/detail/settings.hpp"
#include "httppoll/error.hpp"
#include "httppoll/json.hpp"
#include "httppoll/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace httppoll {

namespace {

auto to_invalid_configuration(const caf::error& err) -> caf::error {
  if (err.category() == caf::type_id_v<ec>
      and static_cast<ec>(err.code()) == ec::invalid_configuration)
    return err;
  return caf::make_error(ec::invalid_configuration, render(err));
}

} // namespace

http_api_client::http_api_client(std::shared_ptr<data_extractor> extractor)
  : http_api_client{std::move(extractor), make_http_client} {
}

http_api_client::http_api_client(std::shared_ptr<data_extractor> extractor,
                                 http_client_factory make_client)
  : extractor_{std::move(extractor)}, make_client_{std::move(make_client)} {
  HTTPPOLL_ASSERT(extractor_ != nullptr);
  HTTPPOLL_ASSERT(make_client_);
}

http_api_client::~http_api_client() noexcept {
  close();
}

auto http_api_client::configure(const caf::settings& cfg) -> caf::error {
  close();
  auto server_uri = detail::get_required<std::string>(cfg, "http.server-uri");
  if (not server_uri)
    return std::move(server_uri.error());
  auto endpoint = detail::get_required<std::string>(cfg, "http.endpoint");
  if (not endpoint)
    return std::move(endpoint.error());
  auto method = detail::get_option<std::string>(cfg, "http.method");
  if (not method)
    return std::move(method.error());
  auto method_name
    = method->value_or(std::string{defaults::http::method});
  std::transform(method_name.begin(), method_name.end(), method_name.begin(),
                 [](auto c) {
                   return static_cast<char>(
                     std::toupper(static_cast<unsigned char>(c)));
                 });
  if (method_name.empty())
    return caf::make_error(ec::invalid_configuration,
                           "option 'http.method' must not be empty");
  auto url = url_builder{join_url(*server_uri, *endpoint)}.build();
  if (not url)
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("invalid server URI or endpoint: {}",
                                       render(url.error())));
  auto auth = make_authenticator(cfg);
  if (not auth)
    return to_invalid_configuration(auth.error());
  if (auto err = extractor_->configure(cfg))
    return to_invalid_configuration(
      add_context(err, "failed to configure {} extractor", extractor_->name()));
  auto client = make_client_(cfg, *auth);
  if (not client)
    return to_invalid_configuration(
      add_context(client.error(), "failed to create HTTP client"));
  config_ = cfg;
  url_ = std::move(*url);
  method_ = std::move(method_name);
  authenticator_ = std::move(*auth);
  client_ = std::move(*client);
  HTTPPOLL_INFO("configured API client for {} {} with {} authentication and "
                "{} extractor",
                method_, url_, authenticator_->name(), extractor_->name());
  return {};
}

auto http_api_client::partitions() const
  -> caf::expected<std::vector<partition>> {
  if (not client_)
    return caf::make_error(ec::api_client_error,
                           "cannot enumerate partitions of an unconfigured "
                           "client");
  auto url = url_builder{url_}.build();
  if (not url)
    return caf::make_error(ec::api_client_error,
                           fmt::format("failed to construct partition URL: {}",
                                       render(url.error())));
  auto result = std::vector<partition>{};
  result.push_back(partition{
    .url = std::move(*url),
    .method = method_,
    .metadata = {},
  });
  return result;
}

auto http_api_client::initial_offset(const partition&) const -> offset {
  return {};
}

auto http_api_client::poll(std::string_view topic, const partition& part,
                           offset& off, size_t items_to_poll,
                           const std::atomic<bool>& stop) const
  -> caf::expected<std::vector<source_record>> {
  // Keep the client alive for the whole cycle.
  auto client = client_;
  if (not client)
    return caf::make_error(ec::api_client_error,
                           fmt::format("cannot poll partition {} with an "
                                       "unconfigured client",
                                       part));
  auto request = build_request(part, off, items_to_poll);
  if (not request)
    return caf::make_error(ec::api_client_error,
                           fmt::format("failed to build request for partition "
                                       "{} with offset {}: {}",
                                       part, to_json(off),
                                       render(request.error())));
  if (not *request) {
    HTTPPOLL_DEBUG("skipping poll of partition {}", part);
    return std::vector<source_record>{};
  }
  if (stop.load()) {
    HTTPPOLL_DEBUG("skipping poll of partition {} after stop request", part);
    return std::vector<source_record>{};
  }
  HTTPPOLL_VERBOSE("polling {} {}", (*request)->method, (*request)->uri);
  auto response = client->execute(std::move(**request));
  if (not response)
    return caf::make_error(ec::api_client_error,
                           fmt::format("request for partition {} with offset "
                                       "{} failed: {}",
                                       part, to_json(off),
                                       render(response.error())));
  auto items = process_response(part, off, *response);
  if (not items)
    return std::move(items.error());
  auto records = assemble(topic, part, off, std::move(*items));
  auto next = update_offset(topic, part, off, *response, records);
  if (not next)
    return caf::make_error(ec::api_client_error,
                           fmt::format("failed to update offset {} of "
                                       "partition {}: {}",
                                       to_json(off), part,
                                       render(next.error())));
  HTTPPOLL_DEBUG("polled {} records from partition {}", records.size(), part);
  off = std::move(*next);
  return records;
}

auto http_api_client::close() -> void {
  if (client_)
    HTTPPOLL_DEBUG("closing API client for {} {}", method_, url_);
  client_.reset();
  authenticator_.reset();
}

auto http_api_client::url() const -> const std::string& {
  return url_;
}

auto http_api_client::method() const -> const std::string& {
  return method_;
}

auto http_api_client::build_request(const partition& part, const offset&,
                                    size_t) const
  -> caf::expected<std::optional<http::request>> {
  auto result = http::request{};
  result.method = part.method;
  result.uri = part.url;
  return std::optional{std::move(result)};
}

auto http_api_client::build_request(const partition& part,
                                    const route_params& route,
                                    const query_params& query) const
  -> caf::expected<std::optional<http::request>> {
  auto url
    = url_builder{part.url}.route_params(route).query_params(query).build();
  if (not url)
    return std::move(url.error());
  auto result = http::request{};
  result.method = part.method;
  result.uri = std::move(*url);
  return std::optional{std::move(result)};
}

auto http_api_client::process_response(const partition& part,
                                       const offset& off,
                                       const http::response& res) const
  -> caf::expected<std::vector<item>> {
  if (auto err = validate(res, part, off))
    return err;
  auto items = extractor_->extract(part, off, res);
  if (not items)
    return caf::make_error(ec::api_client_error,
                           fmt::format("failed to extract data from response "
                                       "for partition {} with offset {}: {}",
                                       part, to_json(off),
                                       render(items.error())));
  return items;
}

auto http_api_client::update_offset(std::string_view, const partition&,
                                    const offset& off, const http::response&,
                                    const std::vector<source_record>&) const
  -> caf::expected<offset> {
  return off;
}

auto http_api_client::config() const -> const caf::settings& {
  return config_;
}

auto http_api_client::extractor() const -> const data_extractor& {
  return *extractor_;
}

auto validate(const http::response& res, const partition& part,
              const offset& off) -> caf::error {
  if (res.is_success())
    return {};
  HTTPPOLL_ERROR("unexpected status {} with body {} for partition {} with "
                 "offset {}",
                 res.status_line(), res.body, part, to_json(off));
  return caf::make_error(ec::api_client_error,
                         fmt::format("unexpected status {} with body {} for "
                                     "partition {} with offset {}",
                                     res.status_line(), res.body, part,
                                     to_json(off)));
}

} // namespace httppoll
