// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "CaptureOutputStream.hxx"
#include "command/AllCommands.hxx"
#include "command/CommandError.hxx"
#include "command/Context.hxx"
#include "command/Response.hxx"
#include "config/Data.hxx"
#include "maya/Error.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <initializer_list>
#include <span>
#include <string>
#include <vector>

using namespace std::chrono;

class CommandTest : public ::testing::Test {
protected:
	CommandContext context;

	void SetUp() override {
		command_init();
		context.start = sys_days{year{2020}/1/1};
	}

	std::string Run(std::initializer_list<const char *> argv) {
		const std::vector<const char *> v(argv);
		CaptureOutputStream os;
		Response r(os);
		command_process(context, std::span{v}, r);
		return os.GetValue();
	}

	CommandErrorCode RunError(std::initializer_list<const char *> argv) {
		try {
			Run(argv);
		} catch (const CommandError &e) {
			return e.GetCode();
		}

		ADD_FAILURE() << "no CommandError";
		return CommandErrorCode::UNKNOWN;
	}
};

TEST_F(CommandTest, Convert)
{
	EXPECT_EQ(Run({"convert", "2012-12-21"}),
		  "date: 2012-12-21\n"
		  "haab: 3 Kʼankʼin\n"
		  "tzolkin: 4 Ajaw\n");
	EXPECT_EQ(Run({"haab", "2019-03-21"}), "14 Kumkʼu\n");
	EXPECT_EQ(Run({"tzolkin", "2019-03-21"}), "10 Imix\n");
}

TEST_F(CommandTest, DateFormat)
{
	context.date_format = "%d.%m.%Y";
	EXPECT_EQ(Run({"tzolkin", "21.12.2012"}), "4 Ajaw\n");

	try {
		Run({"tzolkin", "2012-12-21"});
		FAIL();
	} catch (const Maya::CalendarError &e) {
		EXPECT_EQ(e.GetCode(), Maya::CalendarResult::INVALID_DATE);
	}
}

TEST_F(CommandTest, Add)
{
	EXPECT_EQ(Run({"add", "haab", "0", "Pop", "-1"}), "4 Wayebʼ\n");
	EXPECT_EQ(Run({"add", "haab", "0", "1", "365"}), "0 Pop\n");
	EXPECT_EQ(Run({"add", "tzolkin", "1", "imix", "2"}), "3 Akʼbʼal\n");
}

TEST_F(CommandTest, Diff)
{
	EXPECT_EQ(Run({"diff", "haab", "0", "Pop", "4", "Wayebʼ"}), "364\n");
	EXPECT_EQ(Run({"diff", "haab", "4", "Wayebʼ", "0", "Pop"}), "1\n");
	EXPECT_EQ(Run({"diff", "tzolkin", "1", "Imix", "1", "Imix"}), "0\n");
	EXPECT_EQ(Run({"diff", "tzolkin", "1", "Imix", "8", "Imix"}), "20\n");
}

TEST_F(CommandTest, Info)
{
	EXPECT_EQ(Run({"info", "haab", "3", "Kʼankʼin"}),
		  "date: 3 Kʼankʼin\n"
		  "number: 3\n"
		  "name: Kʼankʼin\n"
		  "name_number: 14\n"
		  "cycle_day: 264\n");

	/* names typed without the modifier letter apostrophe */
	EXPECT_EQ(Run({"info", "haab", "3", "kankin"}),
		  "date: 3 Kʼankʼin\n"
		  "number: 3\n"
		  "name: Kʼankʼin\n"
		  "name_number: 14\n"
		  "cycle_day: 264\n");
}

TEST_F(CommandTest, Search)
{
	EXPECT_EQ(Run({"next", "tzolkin", "4", "Ajaw"}), "2020-02-03\n");
	EXPECT_EQ(Run({"next", "haab", "0", "Wayeb'"}), "2020-03-26\n");
	EXPECT_EQ(Run({"last", "haab", "0", "wayeb"}), "2019-03-27\n");
	EXPECT_EQ(Run({"last", "tzolkin", "4", "Ajaw"}), "2019-05-19\n");
	EXPECT_EQ(Run({"next", "haab", "0", "Pop", "2"}),
		  "2020-03-31\n"
		  "2021-03-31\n");
	EXPECT_EQ(Run({"last", "haab", "0", "Pop", "2"}),
		  "2019-04-01\n"
		  "2018-04-01\n");

	context.list_size = 3;
	EXPECT_EQ(Run({"next", "tzolkin", "4", "Ajaw"}),
		  "2020-02-03\n"
		  "2020-10-20\n"
		  "2021-07-07\n");
	EXPECT_EQ(Run({"next", "tzolkin", "4", "Ajaw", "1"}), "2020-02-03\n");

	/* the start day itself matches */
	context.start = sys_days{year{2012}/12/21};
	EXPECT_EQ(Run({"last", "tzolkin", "4", "Ajaw", "1"}), "2012-12-21\n");
}

TEST_F(CommandTest, Parse)
{
	EXPECT_EQ(Run({"parse", "haab", "kankin"}), "14\n");
	EXPECT_EQ(Run({"parse", "tzolkin", "Ak'b'al"}), "3\n");
	EXPECT_EQ(Run({"parse", "tzolkin", "xyz"}), "0\n");
}

TEST_F(CommandTest, Calendar)
{
	const auto haab = Run({"calendar", "haab"});
	EXPECT_EQ(haab.substr(0, 12), "0 Pop\n1 Pop\n");
	EXPECT_EQ(std::count(haab.begin(), haab.end(), '\n'), 365);
	EXPECT_NE(haab.find("\n4 Wayebʼ\n"), haab.npos);

	const auto tzolkin = Run({"calendar", "tzolkin"});
	EXPECT_EQ(tzolkin.substr(0, 14), "1 Imix\n2 Ikʼ\n");
	EXPECT_EQ(std::count(tzolkin.begin(), tzolkin.end(), '\n'), 260);
}

TEST_F(CommandTest, Usage)
{
	CaptureOutputStream os;
	Response r(os);
	command_print_usage(r);
	EXPECT_EQ(os.CountLines(), 11u);
	EXPECT_NE(os.GetValue().find("  next SYSTEM NUMBER NAME [COUNT]\n"),
		  std::string::npos);
}

TEST_F(CommandTest, Commands)
{
	const auto commands = Run({"commands"});
	EXPECT_EQ(commands.substr(0, 13), "add\ncalendar\n");
	EXPECT_NE(commands.find("\ntzolkin\n"), commands.npos);
}

TEST_F(CommandTest, Errors)
{
	EXPECT_EQ(RunError({}), CommandErrorCode::UNKNOWN);
	EXPECT_EQ(RunError({"foo"}), CommandErrorCode::UNKNOWN);
	EXPECT_EQ(RunError({"calendar"}), CommandErrorCode::ARG);
	EXPECT_EQ(RunError({"calendar", "gregorian"}), CommandErrorCode::ARG);
	EXPECT_EQ(RunError({"info", "haab", "3"}), CommandErrorCode::ARG);
	EXPECT_EQ(RunError({"haab", "2012-12-21", "x"}), CommandErrorCode::ARG);
	EXPECT_EQ(RunError({"info", "haab", "x", "Pop"}), CommandErrorCode::ARG);
	EXPECT_EQ(RunError({"next", "haab", "0", "Pop", "0"}),
		  CommandErrorCode::ARG);

	try {
		Run({"info", "haab", "5", "Wayebʼ"});
		FAIL();
	} catch (const Maya::CalendarError &e) {
		EXPECT_EQ(e.GetCode(), Maya::CalendarResult::INVALID_NUMBER);
	}

	try {
		Run({"info", "tzolkin", "1", "Pop"});
		FAIL();
	} catch (const Maya::CalendarError &e) {
		EXPECT_EQ(e.GetCode(), Maya::CalendarResult::INVALID_NAME);
	}

	try {
		Run({"next", "haab", "0", "xyz"});
		FAIL();
	} catch (const Maya::CalendarError &e) {
		EXPECT_EQ(e.GetCode(), Maya::CalendarResult::INVALID_NAME);
	}
}

TEST(CommandContext, Make)
{
	ConfigData config;
	config.AddParam(ConfigOption::DATE_FORMAT, ConfigParam("%d.%m.%Y", 1));
	config.AddParam(ConfigOption::LIST_SIZE, ConfigParam("4", 2));
	config.AddParam(ConfigOption::START_DATE, ConfigParam("21.12.2012", 3));

	const auto a = MakeCommandContext(config, nullptr, nullptr, 0);
	EXPECT_EQ(a.date_format, "%d.%m.%Y");
	EXPECT_EQ(a.list_size, 4u);
	EXPECT_EQ(a.GetStart(), sys_days{year{2012}/12/21});

	/* the command line overrides the configuration */
	const auto b = MakeCommandContext(config, "%Y-%m-%d", "2019-03-21", 2);
	EXPECT_EQ(b.date_format, "%Y-%m-%d");
	EXPECT_EQ(b.list_size, 2u);
	EXPECT_EQ(b.GetStart(), sys_days{year{2019}/3/21});

	const auto c = MakeCommandContext(ConfigData{}, nullptr, nullptr, 0);
	EXPECT_EQ(c.date_format, CommandContext::DEFAULT_DATE_FORMAT);
	EXPECT_EQ(c.list_size, 0u);
	EXPECT_FALSE(c.start.has_value());
}
