//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace httppoll::detail {

/// Registers the CAF meta objects of all types that httppoll sends through
/// errors and messages. Safe to call more than once.
void add_message_types();

} // namespace httppoll::detail
