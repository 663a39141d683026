//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/data_extractor.hpp"

namespace httppoll {

auto data_extractor::configure(const caf::settings&) -> caf::error {
  return {};
}

auto extractor_registry() -> registry<data_extractor>& {
  static auto result = registry<data_extractor>{};
  return result;
}

} // namespace httppoll
