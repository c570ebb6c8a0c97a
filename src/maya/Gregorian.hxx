// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_MAYA_GREGORIAN_HXX
#define MAYACAL_MAYA_GREGORIAN_HXX

#include <chrono>

namespace Maya {

/**
 * Parse a Gregorian date with a strptime() format string.
 *
 * Throws #CalendarError (INVALID_DATE) with the parser's error
 * nested.
 */
std::chrono::sys_days
ParseGregorian(const char *s, const char *format);

/**
 * Parse a Gregorian date in ISO 8601 format ("YYYY-MM-DD").
 *
 * Throws #CalendarError (INVALID_DATE) with the parser's error
 * nested.
 */
std::chrono::sys_days
ParseGregorianISO(const char *s);

/**
 * Returns the current day in the local time zone.
 */
std::chrono::sys_days
Today() noexcept;

} // namespace Maya

#endif
