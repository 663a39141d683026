//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/fwd.hpp"
#include "httppoll/partition.hpp"
#include "httppoll/source_record.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <atomic>
#include <cstddef>
#include <string_view>
#include <vector>

namespace httppoll {

/// The contract between an API client and the host that schedules polls and
/// persists offsets.
///
/// The host calls `configure` once, asks for the partitions and an initial
/// offset for every partition without a persisted one, and then calls `poll`
/// repeatedly. Each poll returns the records of one request and replaces the
/// offset of the partition on success. A failed poll leaves the offset
/// untouched, so the next poll retries from the same position.
class pollable_api_client {
public:
  virtual ~pollable_api_client() noexcept = default;

  /// Validates the configuration and acquires all resources for polling.
  /// Fails with `ec::invalid_configuration`.
  virtual auto configure(const caf::settings& cfg) -> caf::error = 0;

  /// Returns the logical data sources of this client.
  virtual auto partitions() const -> caf::expected<std::vector<partition>> = 0;

  /// Returns the offset to start polling from when the host has none.
  virtual auto initial_offset(const partition& part) const -> offset = 0;

  /// Runs one poll cycle. Polls of distinct partitions may run concurrently.
  /// @param topic The topic of the produced records.
  /// @param part The partition to poll.
  /// @param off The current offset, replaced on success.
  /// @param items_to_poll A hint for the number of items to request.
  /// @param stop Signals that the host is shutting down.
  /// Fails with `ec::api_client_error`.
  virtual auto poll(std::string_view topic, const partition& part, offset& off,
                    size_t items_to_poll, const std::atomic<bool>& stop) const
    -> caf::expected<std::vector<source_record>>
    = 0;

  /// Releases all resources. Idempotent.
  virtual auto close() -> void = 0;
};

} // namespace httppoll
