//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "httppoll/logger.hpp"

#include "httppoll/test/test.hpp"

#include <caf/settings.hpp>

using namespace httppoll;

TEST("log level names") {
  CHECK_EQUAL(loglevel_to_int("quiet"), HTTPPOLL_LOG_LEVEL_QUIET);
  CHECK_EQUAL(loglevel_to_int("ERROR"), HTTPPOLL_LOG_LEVEL_ERROR);
  CHECK_EQUAL(loglevel_to_int("warning"), HTTPPOLL_LOG_LEVEL_WARNING);
  CHECK_EQUAL(loglevel_to_int("Info"), HTTPPOLL_LOG_LEVEL_INFO);
  CHECK_EQUAL(loglevel_to_int("verbose"), HTTPPOLL_LOG_LEVEL_VERBOSE);
  CHECK_EQUAL(loglevel_to_int("debug"), HTTPPOLL_LOG_LEVEL_DEBUG);
  CHECK_EQUAL(loglevel_to_int("trace"), HTTPPOLL_LOG_LEVEL_TRACE);
  CHECK_EQUAL(loglevel_to_int("loud", -1), -1);
}

TEST("the logger starts only once") {
  // The test runner has already set up logging.
  CHECK(detail::logger()->name() == "httppoll");
  auto cfg = caf::settings{};
  caf::put(cfg, "httppoll.console-verbosity", "debug");
  auto ctx = create_log_context(cfg);
  REQUIRE(not ctx);
  CHECK_EQUAL(ctx.error(), ec::invalid_configuration);
  CHECK(detail::logger()->name() == "httppoll");
}
