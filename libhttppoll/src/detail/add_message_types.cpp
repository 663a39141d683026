//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/detail/add_message_types.hpp"

#include "httppoll/error.hpp"
#include "httppoll/fwd.hpp"

#include <caf/init_global_meta_objects.hpp>

#include <mutex>

namespace httppoll::detail {

void add_message_types() {
  static auto flag = std::once_flag{};
  std::call_once(flag, [] {
    caf::core::init_global_meta_objects();
    caf::init_global_meta_objects<caf::id_block::httppoll_types>();
  });
}

} // namespace httppoll::detail
