//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/json_extractor.hpp"

#include "httppoll/detail/settings.hpp"
#include "httppoll/json.hpp"
#include "httppoll/logger.hpp"

#include <fmt/format.h>

namespace httppoll {

auto json_extractor::name() const -> std::string {
  return "json";
}

auto json_extractor::configure(const caf::settings& cfg) -> caf::error {
  auto path = detail::get_option<std::string>(cfg, "http.response.json-path");
  if (not path)
    return std::move(path.error());
  path_.clear();
  if (not *path)
    return {};
  auto str = std::string_view{**path};
  while (not str.empty()) {
    auto dot = str.find('.');
    auto field = str.substr(0, dot);
    if (field.empty())
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("invalid JSON path '{}'", **path));
    path_.emplace_back(field);
    if (dot == std::string_view::npos)
      break;
    str.remove_prefix(dot + 1);
    if (str.empty())
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("invalid JSON path '{}'", **path));
  }
  return {};
}

auto json_extractor::extract(const partition&, const offset&,
                             const http::response& res) const
  -> caf::expected<std::vector<item>> {
  auto result = std::vector<item>{};
  if (res.body.find_first_not_of(" \t\r\n") == std::string::npos)
    return result;
  auto document = from_json(res.body);
  if (not document)
    return std::move(document.error());
  const auto* current = &*document;
  for (const auto& field : path_) {
    const auto* object = caf::get_if<caf::settings>(current);
    if (object == nullptr)
      return caf::make_error(ec::parse_error,
                             fmt::format("cannot select field '{}' of a "
                                         "non-object value",
                                         field));
    auto i = object->find(field);
    if (i == object->end())
      return caf::make_error(ec::parse_error,
                             fmt::format("response lacks field '{}'", field));
    current = &i->second;
  }
  if (auto* xs = caf::get_if<caf::config_value::list>(current)) {
    result.reserve(xs->size());
    for (const auto& x : *xs)
      result.push_back(x);
  } else if (not caf::holds_alternative<caf::none_t>(*current)) {
    result.push_back(*current);
  }
  HTTPPOLL_TRACE("extracted {} items from {}-byte body", result.size(),
                 res.body.size());
  return result;
}

auto json_extractor::path() const -> const std::vector<std::string>& {
  return path_;
}

} // namespace httppoll

HTTPPOLL_REGISTER_EXTRACTOR(httppoll::json_extractor, "json")
