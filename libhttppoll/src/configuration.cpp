//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/configuration.hpp"

#include "httppoll/error.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

namespace httppoll {

namespace {

template <class T>
auto parse_number(std::string_view str, T& x) -> bool {
  const auto* end = str.data() + str.size();
  auto [ptr, err] = std::from_chars(str.data(), end, x);
  return err == std::errc{} and ptr == end;
}

auto parse(const YAML::Node& node) -> item {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return item{};
    case YAML::NodeType::Scalar: {
      auto str = node.as<std::string>();
      // Quoted scalars carry the non-specific tag "!".
      if (node.Tag() == "!")
        return item{std::move(str)};
      // Attempt some type inference.
      if (str == "true")
        return item{true};
      if (str == "false")
        return item{false};
      auto integer = caf::config_value::integer{};
      if (parse_number(str, integer))
        return item{integer};
      auto real = caf::config_value::real{};
      auto has_digit = str.find_first_of("0123456789") != std::string::npos;
      if (has_digit and parse_number(str, real))
        return item{real};
      // Take the input as-is if nothing worked.
      return item{std::move(str)};
    }
    case YAML::NodeType::Sequence: {
      auto xs = caf::config_value::list{};
      xs.reserve(node.size());
      for (const auto& element : node)
        xs.push_back(parse(element));
      return item{std::move(xs)};
    }
    case YAML::NodeType::Map: {
      auto xs = caf::settings{};
      for (const auto& pair : node)
        xs.insert_or_assign(pair.first.as<std::string>(), parse(pair.second));
      return item{std::move(xs)};
    }
  }
  return item{};
}

auto load_contents(const std::filesystem::path& file)
  -> caf::expected<std::string> {
  auto err = std::error_code{};
  if (not std::filesystem::is_regular_file(file, err))
    return caf::make_error(ec::filesystem_error,
                           fmt::format("no such file: {}", file.string()));
  auto in = std::ifstream{file, std::ios::binary};
  if (not in)
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to open {}", file.string()));
  auto buffer = std::ostringstream{};
  buffer << in.rdbuf();
  if (in.bad())
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to read {}", file.string()));
  return std::move(buffer).str();
}

} // namespace

auto from_yaml(std::string_view str) -> caf::expected<item> {
  try {
    auto node = YAML::Load(std::string{str});
    return parse(node);
  } catch (const YAML::Exception& e) {
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to parse YAML at line {} column "
                                       "{}: {}",
                                       e.mark.line + 1, e.mark.column + 1,
                                       e.msg));
  }
}

auto load_yaml(const std::filesystem::path& file)
  -> caf::expected<caf::settings> {
  auto contents = load_contents(file);
  if (not contents)
    return std::move(contents.error());
  auto yaml = from_yaml(*contents);
  if (not yaml)
    return add_context(yaml.error(), "failed to load YAML file {}",
                       file.string());
  if (caf::holds_alternative<caf::none_t>(*yaml))
    return caf::settings{};
  auto* result = caf::get_if<caf::settings>(&*yaml);
  if (result == nullptr)
    return caf::make_error(ec::parse_error,
                           fmt::format("expected a map at the top level of {}",
                                       file.string()));
  return std::move(*result);
}

} // namespace httppoll
