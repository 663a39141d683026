//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/detail/assert.hpp"

#include <cstdio>
#include <cstdlib>

namespace httppoll::detail {

auto panic_impl(std::string message, std::source_location location) -> void {
  fmt::print(stderr, "panic: {}\n  at {}:{} in {}\n", message,
             location.file_name(), location.line(), location.function_name());
  std::fflush(stderr);
  std::abort();
}

} // namespace httppoll::detail
