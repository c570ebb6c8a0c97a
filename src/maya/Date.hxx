// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_MAYA_DATE_HXX
#define MAYACAL_MAYA_DATE_HXX

namespace Maya {

/**
 * One day of a cyclic calendar.  The meaning of the two components
 * is defined by the #System traits class (#Haab or #Tzolkin).
 *
 * This is a plain value; nothing prevents constructing an invalid
 * one, therefore all values which come from outside should be
 * obtained from MakeDate(), which validates them.
 */
template<typename System>
struct Date {
	/**
	 * The day number: 0..19 for Haab', 1..13 for Tzolk'in.
	 */
	unsigned number;

	/**
	 * The 1-based index into the system's day name table.
	 */
	unsigned name;

	constexpr bool operator==(const Date &) const noexcept = default;
};

} // namespace Maya

#endif
