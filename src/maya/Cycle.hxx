// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

/*
 * Calendar arithmetic which is common to all cyclic calendar
 * systems.  The #System template parameter is a traits class like
 * #Haab or #Tzolkin.
 */

#ifndef MAYACAL_MAYA_CYCLE_HXX
#define MAYACAL_MAYA_CYCLE_HXX

#include "Date.hxx"
#include "Error.hxx"
#include "LookupTable.hxx"
#include "Name.hxx"
#include "Occurrences.hxx"
#include "util/Math.hxx"

#include <chrono>
#include <cstdint>
#include <string_view>

namespace Maya {

enum class Direction {
	/**
	 * Search towards the future.
	 */
	FORWARD,

	/**
	 * Search towards the past.
	 */
	BACKWARD,
};

/**
 * Construct a validated #Date.
 *
 * Throws #CalendarError (INVALID_NAME or INVALID_NUMBER).
 */
template<typename System>
Date<System>
MakeDate(int number, int name)
{
	if (name < 1 || unsigned(name) > System::N_NAMES)
		throw FmtCalendarError(CalendarResult::INVALID_NAME,
				       "{} is not a valid {} day name number, it must be between 1 and {}",
				       name, System::title, System::N_NAMES);

	if (number < int(System::MIN_NUMBER) ||
	    unsigned(number) > System::MAX_NUMBER)
		throw FmtCalendarError(CalendarResult::INVALID_NUMBER,
				       "{} is not a valid {} day number, it must be between {} and {}",
				       number, System::title,
				       System::MIN_NUMBER, System::MAX_NUMBER);

	if (!System::IsValidNumber(number, name))
		throw FmtCalendarError(CalendarResult::INVALID_NUMBER,
				       "{} is not a valid day number of {} {}",
				       number, System::title,
				       GetName<System>(name));

	return {unsigned(number), unsigned(name)};
}

/**
 * Construct a validated #Date from a day number and a day name
 * string (see GetNameNumber()).
 *
 * Throws #CalendarError (INVALID_NAME or INVALID_NUMBER).
 */
template<typename System>
Date<System>
MakeDate(int number, std::string_view name)
{
	return MakeDate<System>(number, int(GetNameNumber<System>(name)));
}

/**
 * Returns the position of the (valid) date within the cycle,
 * 0 being System::FIRST.
 */
template<typename System>
[[gnu::pure]]
unsigned
GetOffset(Date<System> date) noexcept
{
	return GetLookupTable<System>().GetOffset(date);
}

/**
 * Returns the position of the Gregorian day within the cycle.
 */
template<typename System>
[[gnu::const]]
constexpr unsigned
GetOffset(std::chrono::sys_days day) noexcept
{
	return FloorMod((day - System::EPOCH).count(), System::CYCLE);
}

/**
 * Convert a Gregorian day to the calendar system.
 */
template<typename System>
[[gnu::pure]]
Date<System>
FromGregorian(std::chrono::sys_days day) noexcept
{
	return GetLookupTable<System>()[GetOffset<System>(day)];
}

/**
 * Add a number of days (or subtract, if negative) to a date.
 */
template<typename System>
[[gnu::pure]]
Date<System>
AddDays(Date<System> date, std::int_least64_t days) noexcept
{
	if constexpr (requires { System::AddDays(date, days); }) {
		return System::AddDays(date, days);
	} else {
		const auto &table = GetLookupTable<System>();
		return table[(table.GetOffset(date) + FloorMod(days, System::CYCLE))
			     % System::CYCLE];
	}
}

/**
 * Calculate the number of days from #start until #end is reached.
 * This is never negative: if #end is "before" #start, the
 * difference wraps around through the next cycle.
 *
 * @return a number of days between 0 and System::CYCLE-1
 */
template<typename System>
[[gnu::pure]]
unsigned
Diff(Date<System> start, Date<System> end) noexcept
{
	if constexpr (requires { System::Diff(start, end); }) {
		return System::Diff(start, end);
	} else {
		const auto &table = GetLookupTable<System>();
		return FloorMod(std::int_least64_t(table.GetOffset(end)) -
				table.GetOffset(start),
				System::CYCLE);
	}
}

/**
 * Find the nearest Gregorian day (starting at #start, inclusive)
 * which has the given date.
 */
template<typename System>
[[gnu::pure]]
std::chrono::sys_days
Search(Date<System> date, std::chrono::sys_days start,
       Direction direction) noexcept
{
	const unsigned forward =
		FloorMod(std::int_least64_t(GetOffset(date)) - GetOffset<System>(start),
			 System::CYCLE);

	if (direction == Direction::FORWARD)
		return start + std::chrono::days{forward};

	const unsigned backward = forward > 0 ? System::CYCLE - forward : 0;
	return start - std::chrono::days{backward};
}

/**
 * Like Search(), but return the #count nearest Gregorian days.
 *
 * @return a range of #count days, or an empty range if #count is
 * less than 1
 */
template<typename System>
[[gnu::pure]]
OccurrenceRange
SearchList(Date<System> date, std::chrono::sys_days start, int count,
	   Direction direction) noexcept
{
	if (count < 1)
		return {};

	const std::chrono::days step{direction == Direction::FORWARD
		? int(System::CYCLE)
		: -int(System::CYCLE)};

	return {Search(date, start, direction), step, std::size_t(count)};
}

} // namespace Maya

#endif
