//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/detail/settings.hpp"

#include "httppoll/logger.hpp"

namespace httppoll::detail {

namespace {

auto merge_settings_impl(const caf::settings& src, caf::settings& dst,
                         size_t depth) -> void {
  if (depth > 100) {
    HTTPPOLL_ERROR("exceeded maximum nesting depth in settings");
    return;
  }
  for (const auto& [key, value] : src) {
    if (const auto* nested = caf::get_if<caf::settings>(&value)) {
      merge_settings_impl(*nested, dst[key].as_dictionary(), depth + 1);
    } else {
      dst.insert_or_assign(key, value);
    }
  }
}

} // namespace

auto merge_settings(const caf::settings& src, caf::settings& dst) -> void {
  merge_settings_impl(src, dst, 0);
}

} // namespace httppoll::detail
