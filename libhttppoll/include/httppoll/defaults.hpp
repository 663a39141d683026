//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace httppoll::defaults {

namespace http {

/// The HTTP method of a partition.
inline constexpr std::string_view method = "GET";

/// The authenticator strategy.
inline constexpr std::string_view auth_type = "none";

/// The name of the extractor used by the driver.
inline constexpr std::string_view extractor = "json";

/// The value of the User-Agent header if not overriden.
inline constexpr std::string_view user_agent = "httppoll/" HTTPPOLL_VERSION;

} // namespace http

namespace poll {

/// The number of items requested per poll.
inline constexpr size_t items = 100;

/// The time between two poll rounds of the driver.
inline constexpr auto interval = std::chrono::milliseconds{10'000};

/// The topic used by the driver.
inline constexpr std::string_view topic = "httppoll";

} // namespace poll

namespace logger {

inline constexpr std::string_view console_verbosity = "info";
inline constexpr std::string_view console_format = "[%T.%e] %^[%l]%$ %v";
inline constexpr std::string_view file_verbosity = "quiet";
inline constexpr std::string_view file_format = "[%Y-%m-%dT%T.%f] [%l] %v";
inline constexpr std::string_view log_file = "httppoll.log";
inline constexpr size_t queue_size = 8'192;
inline constexpr size_t logger_threads = 1;

} // namespace logger

} // namespace httppoll::defaults
