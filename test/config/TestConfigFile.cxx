// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "StringLineReader.hxx"
#include "config/Data.hxx"
#include "config/File.hxx"
#include "config/Option.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

static ConfigData
Load(std::string_view text)
{
	ConfigData data;
	StringLineReader reader(text);
	ReadConfigFile(data, reader);
	return data;
}

static std::string
LoadError(std::string_view text)
{
	try {
		Load(text);
	} catch (...) {
		return GetFullMessage(std::current_exception());
	}

	return {};
}

TEST(ConfigFile, Empty)
{
	const auto data = Load("");
	EXPECT_EQ(data.GetParam(ConfigOption::DATE_FORMAT), nullptr);
	EXPECT_EQ(data.GetString(ConfigOption::DATE_FORMAT, "x"),
		  std::string_view{"x"});
	EXPECT_EQ(data.GetPositive(ConfigOption::LIST_SIZE, 7), 7u);
	EXPECT_FALSE(data.GetBool(ConfigOption::LOG_TIMESTAMP, false));
}

TEST(ConfigFile, Values)
{
	const auto data = Load("# mayacal settings\n"
			       "\n"
			       "date_format \"%d.%m.%Y\"\n"
			       "  list_size 5   # five\n"
			       "log_timestamp yes\n"
			       "start_date 2012-12-21\n");

	const auto *date_format = data.GetParam(ConfigOption::DATE_FORMAT);
	ASSERT_NE(date_format, nullptr);
	EXPECT_EQ(date_format->value, "%d.%m.%Y");
	EXPECT_EQ(date_format->line, 3);

	EXPECT_EQ(data.GetPositive(ConfigOption::LIST_SIZE, 1), 5u);
	EXPECT_TRUE(data.GetBool(ConfigOption::LOG_TIMESTAMP, false));
	EXPECT_STREQ(data.GetString(ConfigOption::START_DATE), "2012-12-21");
	EXPECT_EQ(data.GetParam(ConfigOption::LOG_LEVEL), nullptr);
}

TEST(ConfigFile, Override)
{
	const auto data = Load("list_size 5\n"
			       "list_size 9\n");

	EXPECT_EQ(data.GetPositive(ConfigOption::LIST_SIZE, 1), 9u);
	EXPECT_EQ(data.GetParam(ConfigOption::LIST_SIZE)->line, 2);
}

TEST(ConfigFile, Errors)
{
	EXPECT_EQ(LoadError("list_size 3\nfoo bar\n"),
		  "Error on line 2; unrecognized parameter: foo");
	EXPECT_EQ(LoadError("date_format\n"),
		  "Error on line 1; Value missing");
	EXPECT_EQ(LoadError("list_size 3 4\n"),
		  "Error on line 1; Unknown tokens after value");
	EXPECT_EQ(LoadError("date_format \"%Y\n"),
		  "Error on line 1; Missing closing '\"'");
}

TEST(ConfigFile, BadValue)
{
	const auto data = Load("\n"
			       "list_size -3\n"
			       "log_timestamp maybe\n");

	try {
		data.GetPositive(ConfigOption::LIST_SIZE, 1);
		FAIL();
	} catch (...) {
		EXPECT_EQ(GetFullMessage(std::current_exception()),
			  "Error on line 2; Value must be positive");
	}

	EXPECT_THROW(data.GetBool(ConfigOption::LOG_TIMESTAMP, false),
		     std::runtime_error);
}
