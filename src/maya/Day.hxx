// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_MAYA_DAY_HXX
#define MAYACAL_MAYA_DAY_HXX

#include "Cycle.hxx"
#include "Format.hxx"
#include "Gregorian.hxx"
#include "Haab.hxx"
#include "Tzolkin.hxx"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Maya {

/**
 * A date of the calendar #System with conversions from and to
 * Gregorian dates.  Unlike #Date, this class can only hold valid
 * dates, and the arithmetic methods modify the object.
 */
template<typename System>
class Day {
	Date<System> date;

	explicit constexpr Day(Date<System> _date) noexcept
		:date(_date) {}

public:
	/**
	 * Throws #CalendarError if the number or the name number is
	 * not valid.
	 */
	Day(int number, int name_number)
		:date(MakeDate<System>(number, name_number)) {}

	/**
	 * Throws #CalendarError if the number or the name is not
	 * valid.
	 */
	Day(int number, std::string_view name)
		:date(MakeDate<System>(number, name)) {}

	/**
	 * The number of occurrences returned by GetNextDateList() and
	 * GetLastDateList() if none is given.
	 */
	static constexpr int DEFAULT_LIST_SIZE = 50;

	static Day FromDate(std::chrono::sys_days day) noexcept {
		return Day{FromGregorian<System>(day)};
	}

	/**
	 * Parse a Gregorian date with a strptime() format string and
	 * convert it.
	 *
	 * Throws #CalendarError (INVALID_DATE) on error.
	 */
	static Day FromDateString(const char *s, const char *format) {
		return FromDate(ParseGregorian(s, format));
	}

	/**
	 * Throws #CalendarError (INVALID_DATE) on error.
	 */
	static Day FromIsoFormat(const char *s) {
		return FromDate(ParseGregorianISO(s));
	}

	static Day FromToday() noexcept {
		return FromDate(Today());
	}

	constexpr Date<System> GetDate() const noexcept {
		return date;
	}

	constexpr unsigned GetDayNumber() const noexcept {
		return date.number;
	}

	constexpr std::string_view GetDayName() const noexcept {
		return GetName<System>(date.name);
	}

	constexpr unsigned GetDayNameNumber() const noexcept {
		return date.name;
	}

	/**
	 * Returns the 1-based position of this date within the
	 * cycle, e.g. 1 for "0 Pop" and 365 for "4 Wayebʼ".
	 */
	[[gnu::pure]]
	unsigned GetCycleDay() const noexcept {
		return GetOffset(date) + 1;
	}

	/**
	 * Returns the first Gregorian day on or after #start (default
	 * today) with this date.
	 */
	std::chrono::sys_days GetNextDate(std::chrono::sys_days start=Today()) const noexcept {
		return Search(date, start, Direction::FORWARD);
	}

	OccurrenceRange GetNextDateList(std::chrono::sys_days start=Today(),
					int list_size=DEFAULT_LIST_SIZE) const noexcept {
		return SearchList(date, start, list_size, Direction::FORWARD);
	}

	/**
	 * Returns the last Gregorian day on or before #start (default
	 * today) with this date.
	 */
	std::chrono::sys_days GetLastDate(std::chrono::sys_days start=Today()) const noexcept {
		return Search(date, start, Direction::BACKWARD);
	}

	OccurrenceRange GetLastDateList(std::chrono::sys_days start=Today(),
					int list_size=DEFAULT_LIST_SIZE) const noexcept {
		return SearchList(date, start, list_size, Direction::BACKWARD);
	}

	/**
	 * Add (or subtract, if negative) days to this date.
	 *
	 * @return this object
	 */
	Day &AddDays(std::int_least64_t days) noexcept {
		date = Maya::AddDays(date, days);
		return *this;
	}

	Day &AddDuration(std::chrono::days days) noexcept {
		return AddDays(days.count());
	}

	/**
	 * Returns the number of days from this date until #other is
	 * reached.  This is never negative; see Diff().
	 */
	[[gnu::pure]]
	unsigned GetDayDiff(const Day &other) const noexcept {
		return Diff(date, other.date);
	}

	[[gnu::pure]]
	std::chrono::days GetDayDuration(const Day &other) const noexcept {
		return std::chrono::days{GetDayDiff(other)};
	}

	/**
	 * Throws #CalendarError (INVALID_NAME) if there is no such
	 * day name.
	 */
	static unsigned GetNameNumberFromName(std::string_view name) {
		return GetNameNumber<System>(name);
	}

	/**
	 * @return the day name's number or 0 if there is no match
	 */
	[[gnu::pure]]
	static unsigned ParseName(std::string_view s) noexcept {
		return Maya::ParseName<System>(s);
	}

	/**
	 * Returns all days of the cycle as strings, e.g. "0 Pop",
	 * "1 Pop", ..., "4 Wayebʼ".
	 */
	static std::vector<std::string> GetCalendar() {
		return ListCalendar<System>();
	}

	std::string ToString() const {
		return Maya::ToString(date);
	}

	constexpr bool operator==(const Day &) const noexcept = default;
};

using HaabDay = Day<Haab>;
using TzolkinDay = Day<Tzolkin>;

} // namespace Maya

#endif
