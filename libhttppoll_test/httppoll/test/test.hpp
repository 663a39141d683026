//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/error.hpp"

#include <caf/deep_to_string.hpp>
#include <caf/detail/stringification_inspector.hpp>
#include <caf/expected.hpp>
#include <caf/inspector_access.hpp>
#include <caf/test/test.hpp>
#include <fmt/format.h>

#include <optional>
#include <string>
#include <type_traits>

namespace httppoll::test::detail {

template <class T>
auto stringify(const T& value) {
  if constexpr (std::is_same_v<T, std::nullptr_t>) {
    return std::string{"null"};
  } else if constexpr (std::is_convertible_v<T, std::string>) {
    return std::string{value};
  } else if constexpr (std::is_same_v<T, caf::error>) {
    return ::httppoll::render(value);
  } else if constexpr (requires { std::string{to_string(value)}; }) {
    return std::string{to_string(value)};
  } else if constexpr (std::is_enum_v<T>) {
    return fmt::format("{}", static_cast<std::underlying_type_t<T>>(value));
  } else {
    return caf::deep_to_string(value);
  }
}

template <class T0, class T1>
bool check_eq(const T0& lhs, const T1& rhs,
              caf::detail::source_location location
              = caf::detail::source_location::current()) {
  // Adapted from CAF, but without safety checks.
  if (lhs == rhs) {
    caf::test::reporter::instance().pass(location);
    return true;
  }
  caf::test::reporter::instance().fail(
    caf::test::binary_predicate::eq, stringify(lhs), stringify(rhs), location);
  return false;
}

} // namespace httppoll::test::detail

// -- logging macros -----------------------------------------------------------

#define MESSAGE(...) fmt::println(__VA_ARGS__)

// -- macros for checking results ----------------------------------------------
// Checks that abort the current test on failure
#define REQUIRE(x)                                                             \
  ::caf::test::runnable::current().require(static_cast<bool>(x))
#define REQUIRE_EQUAL(x, y)                                                    \
  ::caf::test::runnable::current().require_eq((x), (y))
#define REQUIRE_NOT_EQUAL(x, y)                                                \
  ::caf::test::runnable::current().require_ne((x), (y))
#define REQUIRE_ERROR(x) REQUIRE_EQUAL(not(x), true)
#define FAIL ::caf::test::runnable::current().fail
// Checks that continue with the current test on failure
#define CHECK(x) ::caf::test::runnable::current().check(static_cast<bool>(x))
#define CHECK_EQUAL(x, y) ::httppoll::test::detail::check_eq((x), (y))
#define CHECK_NOT_EQUAL(x, y)                                                  \
  ::caf::test::runnable::current().check_ne((x), (y))
#define CHECK_GREATER(x, y) ::caf::test::runnable::current().check_gt((x), (y))
#define CHECK_ERROR(x) CHECK_EQUAL(not(x), true)
#define CHECK_SUCCESS(x) CHECK_EQUAL((x), caf::none)
#define CHECK_FAILURE(x) CHECK_NOT_EQUAL((x), caf::none)

namespace httppoll::test {

template <class T>
T unbox(std::optional<T> x) {
  if (not x) {
    FAIL("x == none");
  }
  return std::move(*x);
}

template <class T>
T unbox(caf::expected<T> x) {
  if (not x) {
    FAIL("expected<T> contains an error: {}", ::httppoll::render(x.error()));
  }
  return std::move(*x);
}

template <class T>
T unbox(T* x) {
  if (not x) {
    FAIL("T* contains nullptr");
  }
  return std::move(*x);
}

} // namespace httppoll::test

namespace httppoll {

using test::unbox;

} // namespace httppoll
