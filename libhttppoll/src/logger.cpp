//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/logger.hpp"

#include "httppoll/defaults.hpp"
#include "httppoll/detail/assert.hpp"

#include <caf/settings.hpp>
#include <spdlog/async.h>
#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <memory>

namespace httppoll {

auto create_log_context(const caf::settings& cfg)
  -> caf::expected<caf::detail::scope_guard<void (*)() noexcept>> {
  if (not detail::setup_spdlog(cfg))
    return caf::make_error(ec::invalid_configuration,
                           "failed to set up logging");
  return {caf::detail::make_scope_guard(
    std::addressof(detail::shutdown_spdlog))};
}

auto loglevel_to_int(std::string x, int default_value) -> int {
  for (auto& ch : x)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (x == "quiet")
    return HTTPPOLL_LOG_LEVEL_QUIET;
  if (x == "error")
    return HTTPPOLL_LOG_LEVEL_ERROR;
  if (x == "warning")
    return HTTPPOLL_LOG_LEVEL_WARNING;
  if (x == "info")
    return HTTPPOLL_LOG_LEVEL_INFO;
  if (x == "verbose")
    return HTTPPOLL_LOG_LEVEL_VERBOSE;
  if (x == "debug")
    return HTTPPOLL_LOG_LEVEL_DEBUG;
  if (x == "trace")
    return HTTPPOLL_LOG_LEVEL_TRACE;
  return default_value;
}

namespace {

/// Converts a httppoll log level to an spdlog level.
auto httppoll_loglevel_to_spd(int value) -> spdlog::level::level_enum {
  auto level = spdlog::level::off;
  switch (value) {
    case HTTPPOLL_LOG_LEVEL_QUIET:
      break;
    case HTTPPOLL_LOG_LEVEL_ERROR:
      level = spdlog::level::err;
      break;
    case HTTPPOLL_LOG_LEVEL_WARNING:
      level = spdlog::level::warn;
      break;
    case HTTPPOLL_LOG_LEVEL_INFO:
      level = spdlog::level::info;
      break;
    case HTTPPOLL_LOG_LEVEL_VERBOSE:
      level = spdlog::level::debug;
      break;
    case HTTPPOLL_LOG_LEVEL_DEBUG:
    case HTTPPOLL_LOG_LEVEL_TRACE:
      level = spdlog::level::trace;
      break;
    default:
      HTTPPOLL_UNREACHABLE();
  }
  return level;
}

auto read_verbosity(const caf::settings& cfg, std::string_view key,
                    std::string_view fallback) -> int {
  auto verbosity = std::string{fallback};
  if (const auto* value = caf::get_if<std::string>(&cfg, key))
    verbosity = *value;
  auto result = loglevel_to_int(verbosity, -1);
  if (result < 0)
    fmt::print(stderr, "failed to start logger; {} '{}' is invalid\n", key,
               verbosity);
  return result;
}

} // namespace

namespace detail {

auto setup_spdlog(const caf::settings& cfg) -> bool try {
  if (logger()->name() != "/dev/null") {
    HTTPPOLL_ERROR("log already up");
    return false;
  }
  auto console_verbosity
    = read_verbosity(cfg, "httppoll.console-verbosity",
                     defaults::logger::console_verbosity);
  auto file_verbosity = read_verbosity(cfg, "httppoll.file-verbosity",
                                       defaults::logger::file_verbosity);
  if (console_verbosity < 0 or file_verbosity < 0)
    return false;
  auto color = [&]() -> spdlog::color_mode {
    auto config_value
      = caf::get_or(cfg, "httppoll.console", std::string{"automatic"});
    if (config_value == "automatic")
      return spdlog::color_mode::automatic;
    if (config_value == "always")
      return spdlog::color_mode::always;
    return spdlog::color_mode::never;
  }();
  auto console_format
    = caf::get_or(cfg, "httppoll.console-format",
                  std::string{defaults::logger::console_format});
  auto log_file = caf::get_or(cfg, "httppoll.log-file",
                              std::string{defaults::logger::log_file});
  spdlog::init_thread_pool(defaults::logger::queue_size,
                           defaults::logger::logger_threads);
  auto sinks = std::vector<spdlog::sink_ptr>{};
  auto console_sink
    = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(color);
  console_sink->set_level(httppoll_loglevel_to_spd(console_verbosity));
  console_sink->set_pattern(console_format);
  sinks.push_back(std::move(console_sink));
  if (file_verbosity != HTTPPOLL_LOG_LEVEL_QUIET) {
    auto file_sink
      = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
    file_sink->set_level(httppoll_loglevel_to_spd(file_verbosity));
    file_sink->set_pattern(std::string{defaults::logger::file_format});
    sinks.push_back(std::move(file_sink));
  }
  auto result = std::make_shared<spdlog::async_logger>(
    "httppoll", sinks.begin(), sinks.end(), spdlog::thread_pool(),
    spdlog::async_overflow_policy::block);
  result->set_level(httppoll_loglevel_to_spd(
    std::max(console_verbosity, file_verbosity)));
  result->flush_on(spdlog::level::err);
  spdlog::register_logger(result);
  logger() = std::move(result);
  return true;
} catch (const spdlog::spdlog_ex& err) {
  fmt::print(stderr, "failed to start logger: {}\n", err.what());
  return false;
}

auto shutdown_spdlog() noexcept -> void {
  if (logger()->name() == "/dev/null")
    return;
  HTTPPOLL_DEBUG("shutting down logger");
  logger()->flush();
  spdlog::drop_all();
  logger() = spdlog::null_logger_mt("/dev/null");
  spdlog::shutdown();
}

auto logger() -> std::shared_ptr<spdlog::logger>& {
  static auto result = spdlog::null_logger_mt("/dev/null");
  return result;
}

} // namespace detail

} // namespace httppoll
