//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/http.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace httppoll::http {

auto message::header(std::string_view name) -> struct header* {
  auto pred = [&](auto& x) -> bool {
    if (x.name.size() != name.size())
      return false;
    for (auto i = 0u; i < name.size(); ++i) {
      auto lhs = static_cast<unsigned char>(x.name[i]);
      auto rhs = static_cast<unsigned char>(name[i]);
      if (std::toupper(lhs) != std::toupper(rhs))
        return false;
    }
    return true;
  };
  auto i = std::find_if(headers.begin(), headers.end(), pred);
  return i == headers.end() ? nullptr : &*i;
}

auto message::header(std::string_view name) const -> const struct header* {
  // We use a const_cast to avoid duplicating logic.
  auto* self = const_cast<message*>(this);
  return self->header(name);
}

auto response::is_success() const -> bool {
  return status_code >= 200 and status_code <= 299;
}

auto response::status_line() const -> std::string {
  auto result = fmt::format("{}/{} {}", protocol, version, status_code);
  if (not status_text.empty()) {
    result += ' ';
    result += status_text;
  }
  return result;
}

} // namespace httppoll::http
