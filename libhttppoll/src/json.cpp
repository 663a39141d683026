//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/json.hpp"

#include "httppoll/error.hpp"

#include <caf/json_array.hpp>
#include <caf/json_object.hpp>
#include <caf/json_value.hpp>
#include <fmt/format.h>

#include <cmath>

namespace httppoll {

namespace {

auto convert(const caf::json_value& x) -> item {
  if (x.is_null() or x.is_undefined())
    return item{};
  if (x.is_bool())
    return item{x.to_bool()};
  if (x.is_integer())
    return item{x.to_integer()};
  if (x.is_unsigned())
    return item{static_cast<double>(x.to_unsigned())};
  if (x.is_double())
    return item{x.to_double()};
  if (x.is_string())
    return item{std::string{x.to_string()}};
  if (x.is_array()) {
    auto result = caf::config_value::list{};
    for (auto element : x.to_array())
      result.push_back(convert(element));
    return item{std::move(result)};
  }
  auto result = caf::settings{};
  auto object = x.to_object();
  for (auto i = object.begin(); i != object.end(); ++i)
    result.insert_or_assign(std::string{i.key()}, convert(i.value()));
  return item{std::move(result)};
}

auto print_string(std::string_view str, std::string& out) -> void {
  out += '"';
  for (auto c : str) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20)
          out += fmt::format("\\u{:04x}", static_cast<unsigned char>(c));
        else
          out += c;
    }
  }
  out += '"';
}

auto print(const caf::settings& xs, std::string& out) -> void;

auto print(const item& x, std::string& out) -> void {
  if (const auto* b = caf::get_if<bool>(&x)) {
    out += *b ? "true" : "false";
  } else if (const auto* i = caf::get_if<caf::config_value::integer>(&x)) {
    out += fmt::format("{}", *i);
  } else if (const auto* r = caf::get_if<caf::config_value::real>(&x)) {
    if (std::isfinite(*r))
      out += fmt::format("{}", *r);
    else
      out += "null";
  } else if (const auto* str = caf::get_if<std::string>(&x)) {
    print_string(*str, out);
  } else if (const auto* xs = caf::get_if<caf::config_value::list>(&x)) {
    out += '[';
    auto first = true;
    for (const auto& element : *xs) {
      if (not first)
        out += ", ";
      first = false;
      print(element, out);
    }
    out += ']';
  } else if (const auto* dict = caf::get_if<caf::settings>(&x)) {
    print(*dict, out);
  } else if (caf::holds_alternative<caf::none_t>(x)) {
    out += "null";
  } else {
    // Timespans and URIs have no JSON counterpart.
    print_string(caf::to_string(x), out);
  }
}

auto print(const caf::settings& xs, std::string& out) -> void {
  out += '{';
  auto first = true;
  for (const auto& [key, value] : xs) {
    if (not first)
      out += ", ";
    first = false;
    print_string(key, out);
    out += ": ";
    print(value, out);
  }
  out += '}';
}

} // namespace

auto from_json(std::string_view str) -> caf::expected<item> {
  auto parsed = caf::json_value::parse(str);
  if (not parsed)
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to parse JSON: {}",
                                       render(parsed.error())));
  return convert(*parsed);
}

auto to_json(const item& x) -> std::string {
  auto result = std::string{};
  print(x, result);
  return result;
}

auto to_json(const caf::settings& xs) -> std::string {
  auto result = std::string{};
  print(xs, result);
  return result;
}

} // namespace httppoll
