/*!
 * \file test_log.cpp
 * \brief file test_log.cpp
 *
 * Copyright 2016 by Intel.
 *
 * Contact: kevin.rogovin@intel.com
 *
 * This Source Code Form is subject to the
 * terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with
 * this file, You can obtain one at
 * http://mozilla.org/MPL/2.0/.
 *
 * \author Kevin Rogovin <kevin.rogovin@intel.com>
 *
 */

#include <sstream>
#include <stdexcept>
#include <gtest/gtest.h>
#include <coverdraw/util/log.hpp>
#include <coverdraw/raster/raster_params.hpp>

using namespace coverdraw;

TEST(LogTest, MessageReachesStreamLogger)
{
  std::ostringstream str;
  reference_counted_ptr<StreamLogger> logger;

  logger = COVERDRAWnew StreamLogger(str, LogCallbackSet::debug_level);
  COVERDRAWlog_warning("value = " << 42);
  logger->active(false);

  EXPECT_NE(str.str().find("[warning_level]"), std::string::npos);
  EXPECT_NE(str.str().find("value = 42"), std::string::npos);
}

TEST(LogTest, MessagesBelowMinimumLevelAreDropped)
{
  std::ostringstream str;
  reference_counted_ptr<StreamLogger> logger;

  logger = COVERDRAWnew StreamLogger(str, LogCallbackSet::warning_level);
  COVERDRAWlog_debug("not shown");
  COVERDRAWlog_info("not shown either");
  logger->active(false);

  EXPECT_TRUE(str.str().empty());
}

TEST(LogTest, InactiveCallbacksAreDetached)
{
  LogCallbackSet set("test");
  std::ostringstream str;
  reference_counted_ptr<StreamLogger> logger;

  EXPECT_FALSE(set.has_callbacks());
  EXPECT_STREQ(set.label(), "test");

  logger = COVERDRAWnew StreamLogger(str, LogCallbackSet::debug_level, &set);
  EXPECT_TRUE(set.has_callbacks());

  set.message(LogCallbackSet::info_level, "hello", "file.cpp", 7);
  EXPECT_EQ(str.str(), "[info_level][file.cpp,7]: hello\n");

  logger->active(false);
  EXPECT_FALSE(set.has_callbacks());
  set.message(LogCallbackSet::info_level, "dropped", "file.cpp", 8);
  EXPECT_EQ(str.str(), "[info_level][file.cpp,7]: hello\n");

  logger->active(true);
  EXPECT_TRUE(set.has_callbacks());
  logger.clear();
  EXPECT_FALSE(set.has_callbacks());
}

TEST(LogTest, FailedRequirementThrowsAndLogs)
{
  std::ostringstream str;
  reference_counted_ptr<StreamLogger> logger;
  RasterParams params;

  logger = COVERDRAWnew StreamLogger(str, LogCallbackSet::error_level);
  EXPECT_THROW(params.sub_samples(0), std::invalid_argument);
  EXPECT_THROW(params.curve_tolerance(0.0f), std::invalid_argument);
  logger->active(false);

  EXPECT_NE(str.str().find("[error_level]"), std::string::npos);
  EXPECT_NE(str.str().find("sub_samples must be positive"), std::string::npos);

  /* failed setters leave the value unchanged */
  EXPECT_EQ(params.sub_samples(), 16u);
}

TEST(LogTest, LevelLabels)
{
  EXPECT_STREQ(LogCallbackSet::label(LogCallbackSet::debug_level), "debug_level");
  EXPECT_STREQ(LogCallbackSet::label(LogCallbackSet::error_level), "error_level");
}
