// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_MAYA_NAME_HXX
#define MAYACAL_MAYA_NAME_HXX

#include "Error.hxx"

#include <fmt/format.h>

#include <cassert>
#include <span>
#include <string_view>

namespace Maya {

/**
 * Look up a name in the table, ignoring the case of ASCII letters.
 *
 * @return the 1-based index or 0 if the name was not found
 */
[[gnu::pure]]
unsigned
FindName(std::span<const std::string_view> names,
	 std::string_view s) noexcept;

/**
 * Like FindName(), but compare only ASCII letters and digits, so
 * "kankin", "K'ank'in" and "Kʼankʼin" are all equal.
 *
 * @return the 1-based index or 0 if the name was not found
 */
[[gnu::pure]]
unsigned
FindNameTolerant(std::span<const std::string_view> names,
		 std::string_view s) noexcept;

/**
 * Returns the day name with the given (valid) number.
 */
template<typename System>
[[gnu::const]]
constexpr std::string_view
GetName(unsigned name) noexcept
{
	assert(name >= 1 && name <= System::N_NAMES);

	return System::names[name - 1];
}

/**
 * Convert a day name to its number (1-based).  Case is ignored, but
 * otherwise the string must match the name exactly.
 *
 * Throws #CalendarError (INVALID_NAME) if there is no such name.
 */
template<typename System>
unsigned
GetNameNumber(std::string_view s)
{
	const unsigned i = FindName(System::names, s);
	if (i == 0)
		throw FmtCalendarError(CalendarResult::INVALID_NAME,
				       "\"{}\" is not a valid {} day name, one of: {}",
				       s, System::title,
				       fmt::join(System::names, ", "));

	return i;
}

/**
 * Parse a string which was typed by the user.  Case and all
 * characters which are not ASCII letters or digits are ignored.
 *
 * @return the day name's number or 0 if there is no match
 */
template<typename System>
[[gnu::pure]]
unsigned
ParseName(std::string_view s) noexcept
{
	return FindNameTolerant(System::names, s);
}

/**
 * Like ParseName(), but throw #CalendarError (INVALID_NAME) if there
 * is no match.
 */
template<typename System>
unsigned
ParseNameNumber(std::string_view s)
{
	const unsigned i = ParseName<System>(s);
	if (i == 0)
		throw FmtCalendarError(CalendarResult::INVALID_NAME,
				       "\"{}\" is not a valid {} day name, one of: {}",
				       s, System::title,
				       fmt::join(System::names, ", "));

	return i;
}

} // namespace Maya

#endif
