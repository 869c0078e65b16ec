/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of filerewrite.
 *
 * filerewrite is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * filerewrite is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with filerewrite.  If not, see <https://www.gnu.org/licenses/>.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <memory>
#include <sstream>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filerewrite/error.h>
#include <filerewrite/logger.h>

#include "test_helpers.h"
#include "test_logger.h"

using namespace filerewrite;
using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::MatchesRegex;
using ::testing::Not;
using ::testing::StartsWith;

namespace {

template <typename LoggerPolicy>
class logging_thing {
 public:
  explicit logging_thing(logger& lgr)
      : LOG_PROXY_INIT(lgr) {}

  void log_all() const {
    LOG_ERROR << "error";
    LOG_WARN << "warn";
    LOG_INFO << "info";
    LOG_VERBOSE << "verbose";
    LOG_DEBUG << "debug";
    LOG_TRACE << "trace";
  }

 private:
  LOG_PROXY_DECL(LoggerPolicy);
};

class logging_base {
 public:
  virtual ~logging_base() = default;
  virtual std::string_view policy() const = 0;
};

template <typename LoggerPolicy>
class logging_impl final : public logging_base {
 public:
  explicit logging_impl(logger&) {}
  std::string_view policy() const override { return LoggerPolicy::name(); }
};

std::shared_ptr<test::test_terminal> make_terminal(bool fancy) {
  auto term = std::make_shared<test::test_terminal>();
  term->set_fancy(fancy);
  term->set_is_tty(fancy);
  return term;
}

} // namespace

TEST(logger, parse_level) {
  EXPECT_EQ(logger::parse_level("error"), logger::ERROR);
  EXPECT_EQ(logger::parse_level("verbose"), logger::VERBOSE);
  EXPECT_EQ(logger::parse_level("trace"), logger::TRACE);
  EXPECT_THROW(logger::parse_level("fatal"), runtime_error);
  EXPECT_THROW(logger::parse_level("INFO"), runtime_error);
  EXPECT_EQ(logger::level_name(logger::WARN), "warn");
  EXPECT_EQ(logger::all_level_names(),
            "error, warn, info, verbose, debug, trace");
}

TEST(logger, level_stream_operators) {
  logger::level_type lvl{logger::INFO};

  std::istringstream good("debug");
  good >> lvl;
  EXPECT_FALSE(good.fail());
  EXPECT_EQ(lvl, logger::DEBUG);

  std::istringstream bad("loud");
  bad >> lvl;
  EXPECT_TRUE(bad.fail());
  EXPECT_EQ(lvl, logger::DEBUG);

  std::ostringstream oss;
  oss << logger::VERBOSE;
  EXPECT_EQ(oss.str(), "verbose");
}

TEST(logger, stream_logger_threshold) {
  std::ostringstream os;
  stream_logger lgr(make_terminal(false), os, {.threshold = logger::WARN});

  logging_thing<prod_logger_policy>(lgr).log_all();

  auto const out = os.str();
  EXPECT_THAT(out, HasSubstr("error"));
  EXPECT_THAT(out, HasSubstr("warn"));
  EXPECT_THAT(out, Not(HasSubstr("info")));
  EXPECT_THAT(out, Not(HasSubstr("verbose")));
}

TEST(logger, stream_logger_format) {
  std::ostringstream os;
  stream_logger lgr(make_terminal(false), os,
                    {.threshold = logger::INFO, .with_context = false});

  LOG_PROXY(prod_logger_policy, lgr);
  LOG_WARN << "something odd";

  EXPECT_THAT(os.str(), MatchesRegex("W [0-9:.]+ something odd\n"));
}

TEST(logger, stream_logger_context) {
  std::ostringstream os;
  stream_logger lgr(make_terminal(false), os, {.threshold = logger::VERBOSE});

  LOG_PROXY(prod_logger_policy, lgr);
  LOG_VERBOSE << "with context";

  EXPECT_THAT(os.str(), HasSubstr("[logger_test.cpp:"));
  EXPECT_THAT(os.str(), EndsWith("] with context\n"));
}

TEST(logger, stream_logger_multiline) {
  std::ostringstream os;
  stream_logger lgr(make_terminal(false), os, {.with_context = false});

  LOG_PROXY(prod_logger_policy, lgr);
  LOG_ERROR << "first\nsecond\n";

  std::istringstream iss(os.str());
  std::string l1, l2, l3;
  std::getline(iss, l1);
  std::getline(iss, l2);
  EXPECT_FALSE(std::getline(iss, l3));

  EXPECT_THAT(l1, MatchesRegex("E [0-9:.]+ first"));
  EXPECT_THAT(l2, MatchesRegex("E [.]+ second"));
}

TEST(logger, stream_logger_color) {
  std::ostringstream os;
  stream_logger lgr(make_terminal(true), os, {.with_context = false});

  LOG_PROXY(prod_logger_policy, lgr);
  LOG_ERROR << "red alert";
  LOG_INFO << "plain";

  auto const out = os.str();
  EXPECT_THAT(out, StartsWith("<bold-red>E "));
  EXPECT_THAT(out, HasSubstr("red alert<normal>\n"));
  EXPECT_THAT(out, HasSubstr("I "));
}

TEST(logger, debug_policy_selected_by_threshold) {
  std::ostringstream os;
  stream_logger lgr(make_terminal(false), os, {.threshold = logger::INFO});

  auto obj = make_unique_logging_object<logging_base, logging_impl,
                                        logger_policies>(lgr);
  EXPECT_EQ(obj->policy(), "prod");

  lgr.set_threshold(logger::TRACE);

  obj = make_unique_logging_object<logging_base, logging_impl,
                                   logger_policies>(lgr);
  EXPECT_EQ(obj->policy(), "debug");
}

TEST(logger, prod_policy_drops_debug) {
  test::test_logger lgr(logger::TRACE);

  logging_thing<prod_logger_policy>(lgr).log_all();
  EXPECT_EQ(lgr.get_log().size(), 4);

  lgr.clear();

  logging_thing<debug_logger_policy>(lgr).log_all();
  EXPECT_EQ(lgr.get_log().size(), 6);
}

TEST(logger, timed_entry) {
  test::test_logger lgr(logger::VERBOSE);
  LOG_PROXY(prod_logger_policy, lgr);

  {
    auto ti = LOG_TIMED_VERBOSE;
    ti << "finished work";
  }

  {
    auto ti = LOG_TIMED_VERBOSE;
    static_cast<void>(ti);
  }

  ASSERT_EQ(lgr.get_log().size(), 1);
  EXPECT_THAT(lgr.get_log()[0].output, StartsWith("finished work ["));
  EXPECT_THAT(lgr.get_log()[0].output, EndsWith("]"));
}

TEST(logger, timed_entry_below_threshold) {
  test::test_logger lgr(logger::INFO);
  LOG_PROXY(prod_logger_policy, lgr);

  {
    auto ti = LOG_TIMED_VERBOSE;
    ti << "not shown";
  }

  EXPECT_THAT(lgr.get_log(), IsEmpty());
}
