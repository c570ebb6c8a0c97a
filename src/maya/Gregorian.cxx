// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "Gregorian.hxx"
#include "Error.hxx"
#include "Log.hxx"
#include "time/Convert.hxx"
#include "time/Parser.hxx"

#include <exception>

namespace Maya {

std::chrono::sys_days
ParseGregorian(const char *s, const char *format)
try {
	return ParseDate(s, format);
} catch (...) {
	std::throw_with_nested(FmtCalendarError(CalendarResult::INVALID_DATE,
						"Invalid date: \"{}\"", s));
}

std::chrono::sys_days
ParseGregorianISO(const char *s)
try {
	return ParseISODate(s);
} catch (...) {
	std::throw_with_nested(FmtCalendarError(CalendarResult::INVALID_DATE,
						"Invalid ISO date: \"{}\"", s));
}

std::chrono::sys_days
Today() noexcept
try {
	return ToSysDays(LocalTime(std::chrono::system_clock::now()));
} catch (...) {
	/* localtime_r() failed, which should never happen; fall
	   back to UTC */
	LogError(std::current_exception(), "Failed to determine the local date");
	return std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
}

} // namespace Maya
