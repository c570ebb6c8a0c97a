// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "maya/Cycle.hxx"
#include "maya/Haab.hxx"

#include <gtest/gtest.h>

#include <set>
#include <utility>

using namespace Maya;
using namespace std::chrono;

TEST(Haab, Table)
{
	const auto &table = GetLookupTable<Haab>();
	EXPECT_EQ(table.size(), 365u);

	EXPECT_EQ(table[0], (Date<Haab>{0, 1}));
	EXPECT_EQ(table[19], (Date<Haab>{19, 1}));
	EXPECT_EQ(table[20], (Date<Haab>{0, 2}));
	EXPECT_EQ(table[359], (Date<Haab>{19, 18}));
	EXPECT_EQ(table[360], (Date<Haab>{0, Haab::WAYEB}));
	EXPECT_EQ(table[364], (Date<Haab>{4, Haab::WAYEB}));

	/* every entry is distinct */
	std::set<std::pair<unsigned, unsigned>> seen;
	for (const auto date : table)
		EXPECT_TRUE(seen.emplace(date.number, date.name).second);
	EXPECT_EQ(seen.size(), 365u);

	/* every valid date appears exactly once */
	for (unsigned name = 1; name <= Haab::N_NAMES; ++name) {
		const unsigned n = name == Haab::WAYEB ? 5 : 20;
		for (unsigned number = 0; number < n; ++number) {
			const Date<Haab> date{number, name};
			EXPECT_TRUE(table.Contains(date));
			EXPECT_EQ(table[table.GetOffset(date)], date);
		}
	}

	EXPECT_FALSE(table.Contains(Date<Haab>{5, Haab::WAYEB}));
	EXPECT_FALSE(table.Contains(Date<Haab>{19, Haab::WAYEB}));
}

TEST(Haab, YearDay)
{
	EXPECT_EQ(GetOffset(Date<Haab>{0, 1}), 0u);
	EXPECT_EQ(GetOffset(Date<Haab>{4, Haab::WAYEB}), 364u);
	EXPECT_EQ(GetOffset(Date<Haab>{3, 14}), 263u);
}

TEST(Haab, FromGregorian)
{
	EXPECT_EQ(FromGregorian<Haab>(sys_days{year{2013}/4/2}),
		  (Date<Haab>{0, 1}));
	EXPECT_EQ(FromGregorian<Haab>(sys_days{year{2013}/4/1}),
		  (Date<Haab>{4, Haab::WAYEB}));
	EXPECT_EQ(FromGregorian<Haab>(sys_days{year{2012}/12/21}),
		  (Date<Haab>{3, 14}));
	EXPECT_EQ(FromGregorian<Haab>(sys_days{year{2019}/3/21}),
		  (Date<Haab>{14, 18}));
	EXPECT_EQ(FromGregorian<Haab>(sys_days{year{2000}/1/1}),
		  (Date<Haab>{10, 14}));
	EXPECT_EQ(FromGregorian<Haab>(sys_days{year{1970}/1/1}),
		  (Date<Haab>{3, 14}));
	EXPECT_EQ(FromGregorian<Haab>(sys_days{year{2023}/9/7}),
		  (Date<Haab>{0, 9}));
	EXPECT_EQ(FromGregorian<Haab>(sys_days{year{2021}/3/6}),
		  (Date<Haab>{0, 18}));
	EXPECT_EQ(FromGregorian<Haab>(sys_days{year{1900}/2/28}),
		  (Date<Haab>{4, 16}));
	EXPECT_EQ(FromGregorian<Haab>(sys_days{year{2024}/2/29}),
		  (Date<Haab>{15, 17}));
	EXPECT_EQ(FromGregorian<Haab>(sys_days{year{1}/1/1}),
		  (Date<Haab>{11, 8}));
}

TEST(Haab, MakeDate)
{
	EXPECT_EQ(MakeDate<Haab>(0, 1), (Date<Haab>{0, 1}));
	EXPECT_EQ(MakeDate<Haab>(19, 18), (Date<Haab>{19, 18}));
	EXPECT_EQ(MakeDate<Haab>(4, "Wayebʼ"), (Date<Haab>{4, 19}));
	EXPECT_EQ(MakeDate<Haab>(3, "kʼankʼin"), (Date<Haab>{3, 14}));

	const auto code = [](auto f){
		try {
			f();
		} catch (const CalendarError &e) {
			return e.GetCode();
		}

		ADD_FAILURE() << "no exception";
		return CalendarResult::INVALID_DATE;
	};

	EXPECT_EQ(code([]{ MakeDate<Haab>(20, 1); }),
		  CalendarResult::INVALID_NUMBER);
	EXPECT_EQ(code([]{ MakeDate<Haab>(-1, 1); }),
		  CalendarResult::INVALID_NUMBER);
	EXPECT_EQ(code([]{ MakeDate<Haab>(5, Haab::WAYEB); }),
		  CalendarResult::INVALID_NUMBER);
	EXPECT_EQ(code([]{ MakeDate<Haab>(0, 0); }),
		  CalendarResult::INVALID_NAME);
	EXPECT_EQ(code([]{ MakeDate<Haab>(0, 20); }),
		  CalendarResult::INVALID_NAME);
	EXPECT_EQ(code([]{ MakeDate<Haab>(0, 21); }),
		  CalendarResult::INVALID_NAME);
	EXPECT_EQ(code([]{ MakeDate<Haab>(0, "Imix"); }),
		  CalendarResult::INVALID_NAME);

	/* the name is checked first */
	EXPECT_EQ(code([]{ MakeDate<Haab>(99, 0); }),
		  CalendarResult::INVALID_NAME);
}
