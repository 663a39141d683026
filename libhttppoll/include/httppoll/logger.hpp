//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "httppoll/error.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>
#include <caf/fwd.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

// The log levels map onto spdlog as follows:
// HTTPPOLL_ERROR   -> spdlog::error
// HTTPPOLL_WARN    -> spdlog::warn
// HTTPPOLL_INFO    -> spdlog::info
// HTTPPOLL_VERBOSE -> spdlog::debug
// HTTPPOLL_DEBUG   -> spdlog::trace
// HTTPPOLL_TRACE   -> spdlog::trace
// Which levels survive compilation is controlled by SPDLOG_ACTIVE_LEVEL, which
// the build system derives from the HTTPPOLL_LOG_LEVEL option.

#define HTTPPOLL_LOG_LEVEL_QUIET 0
#define HTTPPOLL_LOG_LEVEL_ERROR 1
#define HTTPPOLL_LOG_LEVEL_WARNING 2
#define HTTPPOLL_LOG_LEVEL_INFO 3
#define HTTPPOLL_LOG_LEVEL_VERBOSE 4
#define HTTPPOLL_LOG_LEVEL_DEBUG 5
#define HTTPPOLL_LOG_LEVEL_TRACE 6

namespace httppoll {

/// Sets up logging from the `httppoll.*` options in the given settings.
/// @returns A guard that shuts down the logger when it goes out of scope.
auto create_log_context(const caf::settings& cfg)
  -> caf::expected<caf::detail::scope_guard<void (*)() noexcept>>;

/// Converts a verbosity name like "info" or "debug" to its numeric level.
/// @note *x* is passed by value because it is modified.
auto loglevel_to_int(std::string x, int default_value = HTTPPOLL_LOG_LEVEL_QUIET)
  -> int;

namespace detail {

/// Creates the logger and its sinks and applies levels and formats. Must be
/// called before using the logger, otherwise messages are silently discarded.
auto setup_spdlog(const caf::settings& cfg) -> bool;

/// Flushes and shuts down the asynchronous logger.
auto shutdown_spdlog() noexcept -> void;

/// Returns the current logger, which is a null logger before setup.
auto logger() -> std::shared_ptr<spdlog::logger>&;

} // namespace detail

} // namespace httppoll

#define HTTPPOLL_TRACE(...)                                                    \
  SPDLOG_LOGGER_TRACE(::httppoll::detail::logger(), __VA_ARGS__)
#define HTTPPOLL_DEBUG(...)                                                    \
  SPDLOG_LOGGER_TRACE(::httppoll::detail::logger(), __VA_ARGS__)
#define HTTPPOLL_VERBOSE(...)                                                  \
  SPDLOG_LOGGER_DEBUG(::httppoll::detail::logger(), __VA_ARGS__)
#define HTTPPOLL_INFO(...)                                                     \
  SPDLOG_LOGGER_INFO(::httppoll::detail::logger(), __VA_ARGS__)
#define HTTPPOLL_WARN(...)                                                     \
  SPDLOG_LOGGER_WARN(::httppoll::detail::logger(), __VA_ARGS__)
#define HTTPPOLL_ERROR(...)                                                    \
  SPDLOG_LOGGER_ERROR(::httppoll::detail::logger(), __VA_ARGS__)
