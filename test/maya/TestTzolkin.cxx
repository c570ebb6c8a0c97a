// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "maya/Cycle.hxx"
#include "maya/Tzolkin.hxx"

#include <gtest/gtest.h>

#include <set>
#include <utility>

using namespace Maya;
using namespace std::chrono;

TEST(Tzolkin, Table)
{
	const auto &table = GetLookupTable<Tzolkin>();
	EXPECT_EQ(table.size(), 260u);

	EXPECT_EQ(table[0], (Date<Tzolkin>{1, 1}));
	EXPECT_EQ(table[1], (Date<Tzolkin>{2, 2}));
	EXPECT_EQ(table[13], (Date<Tzolkin>{1, 14}));
	EXPECT_EQ(table[19], (Date<Tzolkin>{7, 20}));
	EXPECT_EQ(table[20], (Date<Tzolkin>{8, 1}));
	EXPECT_EQ(table[259], (Date<Tzolkin>{13, 20}));

	std::set<std::pair<unsigned, unsigned>> seen;
	for (const auto date : table)
		EXPECT_TRUE(seen.emplace(date.number, date.name).second);
	EXPECT_EQ(seen.size(), 260u);

	for (unsigned name = 1; name <= Tzolkin::N_NAMES; ++name) {
		for (unsigned number = 1; number <= Tzolkin::N_NUMBERS; ++number) {
			const Date<Tzolkin> date{number, name};
			EXPECT_EQ(table[table.GetOffset(date)], date);
		}
	}

	EXPECT_FALSE(table.Contains(Date<Tzolkin>{0, 1}));
}

TEST(Tzolkin, FromGregorian)
{
	EXPECT_EQ(FromGregorian<Tzolkin>(sys_days{year{2013}/4/1}),
		  (Date<Tzolkin>{1, 1}));
	EXPECT_EQ(FromGregorian<Tzolkin>(sys_days{year{2012}/12/21}),
		  (Date<Tzolkin>{4, 20}));
	EXPECT_EQ(FromGregorian<Tzolkin>(sys_days{year{2019}/3/21}),
		  (Date<Tzolkin>{10, 1}));
	EXPECT_EQ(FromGregorian<Tzolkin>(sys_days{year{2000}/1/1}),
		  (Date<Tzolkin>{11, 2}));
	EXPECT_EQ(FromGregorian<Tzolkin>(sys_days{year{1970}/1/1}),
		  (Date<Tzolkin>{13, 5}));
	EXPECT_EQ(FromGregorian<Tzolkin>(sys_days{year{2023}/9/7}),
		  (Date<Tzolkin>{3, 12}));
	EXPECT_EQ(FromGregorian<Tzolkin>(sys_days{year{2021}/3/6}),
		  (Date<Tzolkin>{11, 17}));
	EXPECT_EQ(FromGregorian<Tzolkin>(sys_days{year{1900}/2/28}),
		  (Date<Tzolkin>{10, 16}));
	EXPECT_EQ(FromGregorian<Tzolkin>(sys_days{year{2024}/2/29}),
		  (Date<Tzolkin>{9, 7}));
	EXPECT_EQ(FromGregorian<Tzolkin>(sys_days{year{1}/1/1}),
		  (Date<Tzolkin>{11, 3}));
}

TEST(Tzolkin, AddDays)
{
	/* the closed form agrees with the lookup table */
	const auto &table = GetLookupTable<Tzolkin>();
	for (const auto date : table) {
		for (int n = -600; n <= 600; n += 7) {
			const auto expected =
				table[FloorMod(std::int_least64_t(table.GetOffset(date)) + n,
					       Tzolkin::CYCLE)];
			EXPECT_EQ(AddDays(date, n), expected);
		}
	}
}

TEST(Tzolkin, Diff)
{
	EXPECT_EQ(Diff(Date<Tzolkin>{1, 1}, Date<Tzolkin>{1, 1}), 0u);
	EXPECT_EQ(Diff(Date<Tzolkin>{1, 1}, Date<Tzolkin>{2, 2}), 1u);
	EXPECT_EQ(Diff(Date<Tzolkin>{2, 2}, Date<Tzolkin>{1, 1}), 259u);
	EXPECT_EQ(Diff(Date<Tzolkin>{1, 1}, Date<Tzolkin>{8, 1}), 20u);
	EXPECT_EQ(Diff(Date<Tzolkin>{1, 1}, Date<Tzolkin>{1, 14}), 13u);

	/* the CRT solution agrees with the lookup table */
	const auto &table = GetLookupTable<Tzolkin>();
	for (unsigned i = 0; i < Tzolkin::CYCLE; i += 3)
		for (unsigned j = 0; j < Tzolkin::CYCLE; j += 5)
			EXPECT_EQ(Diff(table[i], table[j]),
				  FloorMod(std::int_least64_t(j) - i,
					   Tzolkin::CYCLE));
}

TEST(Tzolkin, MakeDate)
{
	EXPECT_EQ(MakeDate<Tzolkin>(13, 20), (Date<Tzolkin>{13, 20}));
	EXPECT_EQ(MakeDate<Tzolkin>(4, "ajaw"), (Date<Tzolkin>{4, 20}));

	EXPECT_THROW(MakeDate<Tzolkin>(0, 1), CalendarError);
	EXPECT_THROW(MakeDate<Tzolkin>(14, 1), CalendarError);
	EXPECT_THROW(MakeDate<Tzolkin>(1, 0), CalendarError);
	EXPECT_THROW(MakeDate<Tzolkin>(1, 21), CalendarError);

	try {
		MakeDate<Tzolkin>(14, 1);
		FAIL();
	} catch (const CalendarError &e) {
		EXPECT_EQ(e.GetCode(), CalendarResult::INVALID_NUMBER);
	}

	try {
		MakeDate<Tzolkin>(1, 21);
		FAIL();
	} catch (const CalendarError &e) {
		EXPECT_EQ(e.GetCode(), CalendarResult::INVALID_NAME);
	}

	try {
		MakeDate<Tzolkin>(1, "Pop");
		FAIL();
	} catch (const CalendarError &e) {
		EXPECT_EQ(e.GetCode(), CalendarResult::INVALID_NAME);
	}
}
