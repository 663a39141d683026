//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <fmt/format.h>

#include <source_location>
#include <string>

namespace httppoll::detail {

/// Prints a message with its source location to stderr and aborts.
[[noreturn]] auto panic_impl(std::string message, std::source_location location)
  -> void;

} // namespace httppoll::detail

/// Aborts the process if an internal invariant does not hold. Never use this
/// for errors that a caller could handle.
#define HTTPPOLL_ASSERT(expr, ...)                                             \
  do {                                                                         \
    if (not static_cast<bool>(expr)) [[unlikely]] {                            \
      ::httppoll::detail::panic_impl(                                          \
        ::fmt::format("assertion `{}` failed" __VA_OPT__(": {}"),              \
                      #expr __VA_OPT__(, ) __VA_ARGS__),                       \
        std::source_location::current());                                     \
    }                                                                          \
  } while (false)

/// Marks a code path that cannot be reached, such as the end of an exhaustive
/// switch over an enum.
#define HTTPPOLL_UNREACHABLE()                                                 \
  ::httppoll::detail::panic_impl("unreachable",                                \
                                 std::source_location::current())
