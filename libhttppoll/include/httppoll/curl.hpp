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
#include <curl/curl.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace httppoll::curl {

/// A list of strings, corresponding to a `curl_slist`.
class slist {
  friend class easy;

public:
  slist() = default;

  /// Appends a string to the list.
  /// @param str The string to append.
  /// @pre *str* must be NULL-terminated.
  auto append(std::string_view str) -> void;

  /// Returns the list items in insertion order.
  auto items() const -> std::vector<std::string_view>;

private:
  struct curl_slist_deleter {
    auto operator()(curl_slist* ptr) const noexcept -> void {
      if (ptr) {
        curl_slist_free_all(ptr);
      }
    }
  };

  std::unique_ptr<curl_slist, curl_slist_deleter> slist_;
};

/// Function for `CURLOPT_WRITEFUNCTION` and `CURLOPT_HEADERFUNCTION`.
using write_callback = std::function<void(std::span<const std::byte>)>;

/// Write callback that assumes `user_data` to be a `write_callback*`.
auto on_write(void* ptr, size_t size, size_t nmemb, void* user_data) -> size_t;

/// A single transfer, corresponding to a cURL "easy" handle.
class easy {
public:
  /// Result codes of `curl_easy_*` calls. Lists the codes that callers
  /// commonly branch on; every other `CURLcode` converts as well.
  enum class code : std::underlying_type_t<CURLcode> {
    ok = CURLE_OK,
    unsupported_protocol = CURLE_UNSUPPORTED_PROTOCOL,
    url_malformat = CURLE_URL_MALFORMAT,
    couldnt_resolve_proxy = CURLE_COULDNT_RESOLVE_PROXY,
    couldnt_resolve_host = CURLE_COULDNT_RESOLVE_HOST,
    couldnt_connect = CURLE_COULDNT_CONNECT,
    operation_timedout = CURLE_OPERATION_TIMEDOUT,
    too_many_redirects = CURLE_TOO_MANY_REDIRECTS,
    got_nothing = CURLE_GOT_NOTHING,
    peer_failed_verification = CURLE_PEER_FAILED_VERIFICATION,
    login_denied = CURLE_LOGIN_DENIED,
  };

  /// The subset of the `CURLINFO` enum that we query.
  enum class info {
    response_code = CURLINFO_RESPONSE_CODE,
  };

  /// Helper type that maps from the enum `easy::info` to a type. Used in
  /// `get<info>()`
  template <easy::info what>
  struct info_type;

  easy();

  /// Get info kept inside the handle. This function wraps `curl_easy_getinfo`.
  template <info what>
  auto get() -> std::pair<code, typename info_type<what>::type>;

  /// Sets a numeric transfer option.
  auto set(CURLoption option, long parameter) -> code;

  /// Sets a string transfer option.
  /// @pre *parameter* must be a NULL-terminated string.
  auto set(CURLoption option, std::string_view parameter) -> code;

  /// Sets a write callback that receives the response body.
  auto set(write_callback fun) -> code;

  /// Sets a callback that receives every response header line, including
  /// the status line.
  auto set_header_callback(write_callback fun) -> code;

  /// Sets ` CURLOPT_POSTFIELDSIZE_LARGE`.
  /// @param size The size of the post data.
  auto set_postfieldsize(long size) -> code;

  /// Sets a value of a HTTP header.
  /// @param name The header name, e.g., "User-Agent"
  /// @param value The header value. If empty, the header will be deleted
  /// instead.
  auto set_http_header(std::string_view name, std::string_view value) -> code;

  /// Enumerates the list of all added headers.
  auto headers() const -> std::vector<std::pair<std::string, std::string>>;

  /// `curl_easy_perform`
  auto perform() -> code;

  /// `curl_easy_reset`
  auto reset() -> void;

private:
  struct curl_deleter {
    auto operator()(CURL* ptr) const noexcept -> void {
      if (ptr) {
        curl_easy_cleanup(ptr);
      }
    }
  };

  std::unique_ptr<CURL, curl_deleter> easy_;
  std::unique_ptr<write_callback> on_write_{};
  std::unique_ptr<write_callback> on_header_{};
  slist http_headers_;
};

#define X(ENUM_MEMBER, TYPE)                                                   \
  template <>                                                                  \
  struct easy::info_type<ENUM_MEMBER> : std::type_identity<TYPE> {}
X(easy::info::response_code, long);
#undef X

template <easy::info what>
using info_type_t = typename easy::info_type<what>::type;

template <easy::info what>
auto easy::get() -> std::pair<code, info_type_t<what>> {
  constexpr static auto curl_info = static_cast<CURLINFO>(what);
  auto res = info_type_t<what>{};
  auto c = curl_easy_getinfo(easy_.get(), curl_info, &res);
  return {static_cast<code>(c), res};
}

/// @relates easy
auto to_string(easy::code code) -> std::string_view;

/// @relates easy
auto to_error(easy::code code) -> caf::error;

/// An interface for URL handling based on the `curl_url_*` functions.
class url {
public:
  /// Result codes of `curl_url_*` calls.
  enum class code : std::underlying_type_t<CURLUcode> {
    ok = CURLUE_OK,
    malformed_input = CURLUE_MALFORMED_INPUT,
    bad_port_number = CURLUE_BAD_PORT_NUMBER,
    unsupported_scheme = CURLUE_UNSUPPORTED_SCHEME,
    no_host = CURLUE_NO_HOST,
    bad_hostname = CURLUE_BAD_HOSTNAME,
    bad_path = CURLUE_BAD_PATH,
    bad_query = CURLUE_BAD_QUERY,
    bad_scheme = CURLUE_BAD_SCHEME,
  };

  url();

  /// Parses a complete URL into the handle.
  /// @pre *str* must be a NULL-terminated string.
  auto set(std::string_view str) -> code;

private:
  struct curl_url_deleter {
    auto operator()(CURLU* ptr) const noexcept -> void {
      if (ptr) {
        curl_url_cleanup(ptr);
      }
    }
  };

  std::unique_ptr<CURLU, curl_url_deleter> url_;
};

/// @relates url
auto to_string(url::code code) -> std::string_view;

/// @relates url
auto to_error(url::code code) -> caf::error;

/// URL-encodes a string.
/// @param str The input to encode.
/// @returns The encoded string.
auto escape(std::string_view str) -> std::string;

} // namespace httppoll::curl
