//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/curl.hpp"

#include "httppoll/detail/assert.hpp"
#include "httppoll/error.hpp"

#include <fmt/format.h>

namespace httppoll::curl {

auto slist::append(std::string_view str) -> void {
  auto* slist = slist_.release();
  slist_.reset(curl_slist_append(slist, str.data()));
}

auto slist::items() const -> std::vector<std::string_view> {
  auto result = std::vector<std::string_view>{};
  for (const auto* ptr = slist_.get(); ptr != nullptr; ptr = ptr->next) {
    result.emplace_back(ptr->data);
  }
  return result;
}

auto on_write(void* ptr, size_t size, size_t nmemb, void* user_data) -> size_t {
  HTTPPOLL_ASSERT(size == 1);
  HTTPPOLL_ASSERT(user_data != nullptr);
  const auto* data = reinterpret_cast<const std::byte*>(ptr);
  auto bytes = std::span<const std::byte>{data, nmemb};
  auto* f = reinterpret_cast<write_callback*>(user_data);
  (*f)(bytes);
  return nmemb;
}

easy::easy() : easy_{curl_easy_init()} {
  HTTPPOLL_ASSERT(easy_ != nullptr);
}

auto easy::set(CURLoption option, long parameter) -> code {
  auto curl_code = curl_easy_setopt(easy_.get(), option, parameter);
  return static_cast<code>(curl_code);
}

auto easy::set(CURLoption option, std::string_view parameter) -> code {
  auto curl_code = curl_easy_setopt(easy_.get(), option, parameter.data());
  return static_cast<code>(curl_code);
}

auto easy::set(write_callback fun) -> code {
  HTTPPOLL_ASSERT(fun);
  on_write_ = std::make_unique<write_callback>(std::move(fun));
  auto curl_code
    = curl_easy_setopt(easy_.get(), CURLOPT_WRITEFUNCTION, on_write);
  HTTPPOLL_ASSERT(curl_code == CURLE_OK);
  curl_code = curl_easy_setopt(easy_.get(), CURLOPT_WRITEDATA, on_write_.get());
  return static_cast<code>(curl_code);
}

auto easy::set_header_callback(write_callback fun) -> code {
  HTTPPOLL_ASSERT(fun);
  on_header_ = std::make_unique<write_callback>(std::move(fun));
  auto curl_code
    = curl_easy_setopt(easy_.get(), CURLOPT_HEADERFUNCTION, on_write);
  HTTPPOLL_ASSERT(curl_code == CURLE_OK);
  curl_code
    = curl_easy_setopt(easy_.get(), CURLOPT_HEADERDATA, on_header_.get());
  return static_cast<code>(curl_code);
}

auto easy::set_postfieldsize(long size) -> code {
  HTTPPOLL_ASSERT(size >= 0);
  auto curl_code = curl_easy_setopt(easy_.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                                    static_cast<curl_off_t>(size));
  return static_cast<code>(curl_code);
}

auto easy::set_http_header(std::string_view name, std::string_view value)
  -> code {
  auto header_name = [](std::string_view str) {
    auto i = str.find(':');
    HTTPPOLL_ASSERT(i != std::string_view::npos);
    return str.substr(0, i);
  };
  // Check if we are overwriting a header. Since slists are immutable, this
  // would require rebuilding the list (and has quadratic overhead).
  for (auto header : http_headers_.items()) {
    if (header_name(header) == name) {
      slist copy;
      for (auto item : http_headers_.items()) {
        if (header_name(item) != name) {
          copy.append(std::string{item});
        }
      }
      http_headers_ = std::move(copy);
      break;
    }
  }
  // libcurl deletes a header when it has no value after the colon.
  auto header = value.empty() ? fmt::format("{}:", name)
                              : fmt::format("{}: {}", name, value);
  http_headers_.append(header);
  auto curl_code = curl_easy_setopt(easy_.get(), CURLOPT_HTTPHEADER,
                                    http_headers_.slist_.get());
  return static_cast<code>(curl_code);
}

auto easy::headers() const
  -> std::vector<std::pair<std::string, std::string>> {
  auto result = std::vector<std::pair<std::string, std::string>>{};
  for (auto str : http_headers_.items()) {
    auto i = str.find(':');
    HTTPPOLL_ASSERT(i != std::string_view::npos);
    auto value = str.substr(i + 1);
    if (value.starts_with(' '))
      value.remove_prefix(1);
    result.emplace_back(std::string{str.substr(0, i)}, std::string{value});
  }
  return result;
}

auto easy::perform() -> code {
  auto curl_code = curl_easy_perform(easy_.get());
  return static_cast<code>(curl_code);
}

auto easy::reset() -> void {
  curl_easy_reset(easy_.get());
  on_write_.reset();
  on_header_.reset();
  http_headers_ = {};
}

auto to_string(easy::code code) -> std::string_view {
  auto curl_code = static_cast<CURLcode>(code);
  return {curl_easy_strerror(curl_code)};
}

auto to_error(easy::code code) -> caf::error {
  if (code == easy::code::ok) {
    return {};
  }
  return caf::make_error(ec::transport_error,
                         fmt::format("curl: {}", to_string(code)));
}

url::url() : url_{curl_url()} {
}

auto url::set(std::string_view str) -> code {
  return static_cast<code>(
    curl_url_set(url_.get(), CURLUPART_URL, str.data(), 0));
}

auto to_string(url::code code) -> std::string_view {
  auto curl_code = static_cast<CURLUcode>(code);
  return {curl_url_strerror(curl_code)};
}

auto to_error(url::code code) -> caf::error {
  if (code == url::code::ok) {
    return {};
  }
  return caf::make_error(ec::invalid_argument,
                         fmt::format("curl: {}", to_string(code)));
}

auto escape(std::string_view str) -> std::string {
  auto* easy = curl_easy_init();
  auto result = std::string{};
  auto length = static_cast<int>(str.size());
  if (auto* escaped = curl_easy_escape(easy, str.data(), length)) {
    result = escaped;
    curl_free(escaped);
  }
  curl_easy_cleanup(easy);
  return result;
}

} // namespace httppoll::curl
