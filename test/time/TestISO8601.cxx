// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "time/ISO8601.hxx"
#include "util/StringBuffer.hxx"

#include <gtest/gtest.h>

using namespace std::chrono;

TEST(ISO8601, FormatDate)
{
	EXPECT_STREQ(FormatISODate(year{2012}/12/21).c_str(), "2012-12-21");
	EXPECT_STREQ(FormatISODate(year{1}/1/1).c_str(), "0001-01-01");
	EXPECT_STREQ(FormatISODate(sys_days{year{1970}/1/1}).c_str(),
		     "1970-01-01");
	EXPECT_STREQ(FormatISODate(sys_days{year{2024}/2/29} + days{1}).c_str(),
		     "2024-03-01");
}
