//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/configuration.hpp"
#include "httppoll/data_extractor.hpp"
#include "httppoll/defaults.hpp"
#include "httppoll/detail/add_message_types.hpp"
#include "httppoll/detail/settings.hpp"
#include "httppoll/error.hpp"
#include "httppoll/http_api_client.hpp"
#include "httppoll/json.hpp"
#include "httppoll/logger.hpp"

#include <caf/config_option_set.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace httppoll;

std::atomic<bool> stop_requested = false;

void handle_termination(int signum) {
  stop_requested = true;
  // Restore the default action so that a repeated signal terminates
  // immediately.
  std::signal(signum, SIG_DFL);
}

struct poll_options {
  std::string topic;
  int64_t polls = 0;
  std::chrono::milliseconds interval = defaults::poll::interval;
  size_t items = defaults::poll::items;
};

auto make_poll_options(const caf::settings& cfg)
  -> caf::expected<poll_options> {
  auto result = poll_options{};
  auto topic = detail::get_option<std::string>(cfg, "httppoll.topic");
  if (not topic)
    return std::move(topic.error());
  result.topic = topic->value_or(std::string{defaults::poll::topic});
  auto read_count = [&](std::string_view key,
                        int64_t fallback) -> caf::expected<int64_t> {
    auto value = detail::get_option<int64_t>(cfg, key);
    if (not value)
      return std::move(value.error());
    auto count = value->value_or(fallback);
    if (count < 0)
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("option '{}' must not be negative",
                                         key));
    return count;
  };
  auto polls = read_count("httppoll.polls", 0);
  if (not polls)
    return std::move(polls.error());
  result.polls = *polls;
  auto interval = read_count("httppoll.interval-ms",
                             defaults::poll::interval.count());
  if (not interval)
    return std::move(interval.error());
  result.interval = std::chrono::milliseconds{*interval};
  auto items = read_count("httppoll.items",
                          static_cast<int64_t>(defaults::poll::items));
  if (not items)
    return std::move(items.error());
  result.items = static_cast<size_t>(*items);
  return result;
}

/// Sleeps for the given duration or until a stop was requested.
auto wait_for(std::chrono::milliseconds duration) -> void {
  constexpr auto slice = std::chrono::milliseconds{50};
  auto deadline = std::chrono::steady_clock::now() + duration;
  while (not stop_requested) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return;
    std::this_thread::sleep_for(std::min<std::chrono::nanoseconds>(
      slice, deadline - now));
  }
}

} // namespace

auto main(int argc, char** argv) -> int try {
  auto options
    = caf::config_option_set{}
        .add<std::string>("?httppoll", "config,c",
                          "path to the YAML configuration file")
        .add<std::string>("?httppoll", "topic,t",
                          "topic of the produced records")
        .add<int64_t>("?httppoll", "polls,n",
                      "number of poll rounds, 0 polls until interrupted")
        .add<int64_t>("?httppoll", "interval-ms,i",
                      "milliseconds between two poll rounds")
        .add<int64_t>("?httppoll", "items", "number of items to request")
        .add<std::string>("?httppoll", "verbosity,v",
                          "console verbosity: quiet, error, warning, info, "
                          "verbose, debug, or trace")
        .add<bool>("?httppoll", "help,h", "print this help text");
  auto args = std::vector<std::string>(argv + 1, argv + argc);
  auto cli = caf::settings{};
  auto [pec, it] = options.parse(cli, args);
  if (pec != caf::pec::success) {
    fmt::print(stderr, "failed to parse option '{}': {}\n\n{}\n", *it,
               to_string(pec), options.help_text());
    return EXIT_FAILURE;
  }
  if (caf::get_or(cli, "httppoll.help", false)) {
    fmt::print("{}\n", options.help_text());
    return EXIT_SUCCESS;
  }
  const auto* config_file = caf::get_if<std::string>(&cli, "httppoll.config");
  if (config_file == nullptr) {
    fmt::print(stderr, "missing required option '--config'\n\n{}\n",
               options.help_text());
    return EXIT_FAILURE;
  }
  auto cfg = load_yaml(*config_file);
  if (not cfg) {
    fmt::print(stderr, "{}\n", cfg.error());
    return EXIT_FAILURE;
  }
  // Options from the command line take precedence over the file.
  detail::merge_settings(cli, *cfg);
  if (const auto* verbosity
      = caf::get_if<std::string>(&cli, "httppoll.verbosity"))
    caf::put(*cfg, "httppoll.console-verbosity", *verbosity);
  detail::add_message_types();
  auto log_context = create_log_context(*cfg);
  if (not log_context) {
    fmt::print(stderr, "{}\n", log_context.error());
    return EXIT_FAILURE;
  }
  HTTPPOLL_VERBOSE("loaded configuration file {}", *config_file);
  auto poll_opts = make_poll_options(*cfg);
  if (not poll_opts) {
    HTTPPOLL_ERROR("{}", poll_opts.error());
    return EXIT_FAILURE;
  }
  auto extractor_name = detail::get_option<std::string>(*cfg, "http.extractor");
  if (not extractor_name) {
    HTTPPOLL_ERROR("{}", extractor_name.error());
    return EXIT_FAILURE;
  }
  auto extractor = extractor_registry().make(
    extractor_name->value_or(std::string{defaults::http::extractor}));
  if (not extractor) {
    HTTPPOLL_ERROR("{}", extractor.error());
    return EXIT_FAILURE;
  }
  auto client = http_api_client{std::move(*extractor)};
  if (auto err = client.configure(*cfg)) {
    HTTPPOLL_ERROR("{}", err);
    return EXIT_FAILURE;
  }
  auto parts = client.partitions();
  if (not parts) {
    HTTPPOLL_ERROR("{}", parts.error());
    return EXIT_FAILURE;
  }
  auto offsets = std::vector<offset>{};
  offsets.reserve(parts->size());
  for (const auto& part : *parts)
    offsets.push_back(client.initial_offset(part));
  if (std::signal(SIGINT, handle_termination) == SIG_ERR
      or std::signal(SIGTERM, handle_termination) == SIG_ERR) {
    HTTPPOLL_ERROR("failed to install signal handlers");
    return EXIT_FAILURE;
  }
  HTTPPOLL_INFO("polling {} partition(s) into topic {}", parts->size(),
                poll_opts->topic);
  for (auto round = int64_t{1}; not stop_requested; ++round) {
    for (size_t i = 0; i < parts->size() and not stop_requested; ++i) {
      const auto& part = (*parts)[i];
      auto records = client.poll(poll_opts->topic, part, offsets[i],
                                 poll_opts->items, stop_requested);
      if (not records) {
        HTTPPOLL_WARN("poll of partition {} failed: {}", part,
                      records.error());
        continue;
      }
      for (const auto& record : *records)
        fmt::print("{}\n", to_json(record));
      std::fflush(stdout);
    }
    if (poll_opts->polls > 0 and round >= poll_opts->polls)
      break;
    wait_for(poll_opts->interval);
  }
  if (stop_requested)
    HTTPPOLL_INFO("received termination request, shutting down");
  client.close();
  return EXIT_SUCCESS;
} catch (const std::exception& e) {
  fmt::print(stderr, "unhandled exception: {}\n", e.what());
  return EXIT_FAILURE;
}
