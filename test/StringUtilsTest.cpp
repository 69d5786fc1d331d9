/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "utils/StringUtils.h"

#include <gtest/gtest.h>

using namespace GRAVCAL;
using namespace UTILS;

TEST(StringUtilsTest, TrimStripsWhitespaceAndCarriageReturn)
{
  EXPECT_EQ(StringUtils::Trim("  1.5,2\r"), "1.5,2");
  EXPECT_EQ(StringUtils::Trim("\t\n"), "");
  EXPECT_EQ(StringUtils::Trim("abc"), "abc");
}

TEST(StringUtilsTest, SplitKeepsEmptyFields)
{
  const std::vector<std::string> fields = StringUtils::Split("a, ,b,", ',');

  ASSERT_EQ(fields.size(), 4u);
  EXPECT_EQ(fields[0], "a");
  EXPECT_EQ(fields[1], "");
  EXPECT_EQ(fields[2], "b");
  EXPECT_EQ(fields[3], "");
}

TEST(StringUtilsTest, ParseDoubleAcceptsWholeNumbersOnly)
{
  double value = 0.0;

  EXPECT_TRUE(StringUtils::ParseDouble("-0.25", value));
  EXPECT_DOUBLE_EQ(value, -0.25);

  EXPECT_TRUE(StringUtils::ParseDouble("1e-3", value));
  EXPECT_DOUBLE_EQ(value, 1e-3);

  EXPECT_FALSE(StringUtils::ParseDouble("", value));
  EXPECT_FALSE(StringUtils::ParseDouble("time_s", value));
  EXPECT_FALSE(StringUtils::ParseDouble("1.0abc", value));
  EXPECT_FALSE(StringUtils::ParseDouble("1e999", value));
}
