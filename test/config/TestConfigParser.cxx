// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "config/Parser.hxx"
#include "config/Option.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(ConfigParser, Bool)
{
	EXPECT_TRUE(ParseBool("yes"));
	EXPECT_TRUE(ParseBool("TRUE"));
	EXPECT_TRUE(ParseBool("1"));
	EXPECT_FALSE(ParseBool("no"));
	EXPECT_FALSE(ParseBool("False"));
	EXPECT_FALSE(ParseBool("0"));
	EXPECT_THROW(ParseBool(""), std::runtime_error);
	EXPECT_THROW(ParseBool("on"), std::runtime_error);
}

TEST(ConfigParser, Positive)
{
	EXPECT_EQ(ParsePositive("1"), 1u);
	EXPECT_EQ(ParsePositive("365"), 365u);
	EXPECT_THROW(ParsePositive("0"), std::runtime_error);
	EXPECT_THROW(ParsePositive("-1"), std::runtime_error);
	EXPECT_THROW(ParsePositive("1x"), std::runtime_error);
	EXPECT_THROW(ParsePositive(""), std::runtime_error);
	EXPECT_THROW(ParsePositive("99999999999"), std::runtime_error);
}

TEST(ConfigParser, OptionName)
{
	EXPECT_EQ(ParseConfigOptionName("log_level"), ConfigOption::LOG_LEVEL);
	EXPECT_EQ(ParseConfigOptionName("start_date"), ConfigOption::START_DATE);
	EXPECT_EQ(ParseConfigOptionName("Log_Level"), ConfigOption::MAX);
	EXPECT_EQ(ParseConfigOptionName("nope"), ConfigOption::MAX);
}
