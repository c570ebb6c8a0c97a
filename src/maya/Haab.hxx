// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_MAYA_HAAB_HXX
#define MAYACAL_MAYA_HAAB_HXX

#include "Date.hxx"

#include <array>
#include <chrono>
#include <string_view>

namespace Maya {

/**
 * Traits of the Haab' calendar: a year of 18 months with 20 days
 * each (numbered 0..19), followed by the five days of Wayebʼ
 * (numbered 0..4).
 */
struct Haab {
	static constexpr std::string_view title = "Haab'";
	static constexpr std::string_view keyword = "haab";

	static constexpr unsigned MONTH_DAYS = 20;
	static constexpr unsigned WAYEB_DAYS = 5;

	static constexpr unsigned N_NAMES = 19;

	/**
	 * The name number of Wayebʼ, the last (short) month.
	 */
	static constexpr unsigned WAYEB = N_NAMES;

	static constexpr unsigned CYCLE = (N_NAMES - 1) * MONTH_DAYS + WAYEB_DAYS;
	static_assert(CYCLE == 365);

	static constexpr unsigned MIN_NUMBER = 0;
	static constexpr unsigned MAX_NUMBER = MONTH_DAYS - 1;

	/**
	 * "0 Pop", the first day of the year.
	 */
	static constexpr Date<Haab> FIRST{0, 1};

	/**
	 * A Gregorian day which was #FIRST.
	 */
	static constexpr std::chrono::sys_days EPOCH{std::chrono::year{2013}/4/2};

	static constexpr std::array<std::string_view, N_NAMES> names{
		"Pop", "Woʼ", "Sip", "Sotzʼ", "Tzek", "Xul", "Yaxkʼin",
		"Mol", "Chʼen", "Yax", "Sakʼ", "Keh", "Mak", "Kʼankʼin",
		"Muwanʼ", "Pax", "Kʼayab", "Kumkʼu", "Wayebʼ",
	};

	static constexpr unsigned GetMonthLength(unsigned name) noexcept {
		return name == WAYEB ? WAYEB_DAYS : MONTH_DAYS;
	}

	/**
	 * Check whether the (range-checked) day number exists in the
	 * given month.
	 */
	static constexpr bool IsValidNumber(unsigned number,
					    unsigned name) noexcept {
		return number < GetMonthLength(name);
	}

	static constexpr Date<Haab> NextDay(Date<Haab> date) noexcept {
		if (++date.number < GetMonthLength(date.name))
			return date;

		/* roll over to the next month, and after Wayebʼ to
		   the next year */
		date.number = 0;
		date.name = date.name % N_NAMES + 1;
		return date;
	}
};

} // namespace Maya

#endif
