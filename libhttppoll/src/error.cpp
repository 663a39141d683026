//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/error.hpp"

#include "httppoll/detail/assert.hpp"

#include <caf/deep_to_string.hpp>
#include <caf/message.hpp>
#include <caf/pec.hpp>
#include <caf/sec.hpp>

#include <iterator>
#include <sstream>

namespace httppoll {
namespace {

const char* descriptions[] = {
  "no_error",
  "unspecified",
  "invalid_configuration",
  "invalid_argument",
  "lookup_error",
  "parse_error",
  "transport_error",
  "api_client_error",
  "logic_error",
  "filesystem_error",
};

static_assert(ec{std::size(descriptions)} == ec::ec_count,
              "Mismatch between number of error codes and descriptions");

void render_default_ctx(std::ostringstream& oss, const caf::message& ctx) {
  auto size = ctx.size();
  if (size == 0)
    return;
  oss << ":";
  for (size_t i = 0; i < size; ++i) {
    if (not ctx.match_element<std::string>(i)) {
      // Fall back to CAF's rendering for contexts with non-string elements.
      oss << ' ' << caf::deep_to_string(ctx);
      return;
    }
  }
  for (size_t i = 0; i < size; ++i)
    oss << ' ' << ctx.get_as<std::string>(i);
}

} // namespace

auto to_string(ec x) -> std::string {
  auto index = static_cast<size_t>(x);
  HTTPPOLL_ASSERT(index < std::size(descriptions));
  return descriptions[index];
}

auto from_string(std::string_view str, ec& x) -> bool {
  for (size_t i = 0; i < std::size(descriptions); ++i) {
    if (str == descriptions[i]) {
      x = static_cast<ec>(i);
      return true;
    }
  }
  return false;
}

auto from_integer(std::underlying_type_t<ec> value, ec& x) -> bool {
  if (value >= static_cast<std::underlying_type_t<ec>>(ec::ec_count))
    return false;
  x = static_cast<ec>(value);
  return true;
}

auto render(const caf::error& err) -> std::string {
  if (not err)
    return "";
  auto oss = std::ostringstream{};
  switch (err.category()) {
    default:
      oss << "unknown";
      break;
    case caf::type_id_v<httppoll::ec>:
      oss << to_string(static_cast<httppoll::ec>(err.code()));
      break;
    case caf::type_id_v<caf::pec>:
      oss << to_string(static_cast<caf::pec>(err.code()));
      break;
    case caf::type_id_v<caf::sec>:
      oss << to_string(static_cast<caf::sec>(err.code()));
      break;
  }
  render_default_ctx(oss, err.context());
  return std::move(oss).str();
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error {
  if (not error)
    return {};
  const auto& ctx = error.context();
  if (ctx.size() == 1 and ctx.match_element<std::string>(0))
    str = fmt::format("{}: {}", str, ctx.get_as<std::string>(0));
  else if (ctx.size() > 0)
    str = fmt::format("{}: {}", str, caf::deep_to_string(ctx));
  return caf::error{error.code(), error.category(),
                    caf::make_message(std::move(str))};
}

} // namespace httppoll
