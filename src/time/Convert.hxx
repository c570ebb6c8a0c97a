// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#ifndef TIME_CONVERT_HXX
#define TIME_CONVERT_HXX

#include <chrono>

/**
 * Convert a UTC-based time point to a local "struct tm".
 *
 * Throws on error.
 */
struct tm
LocalTime(std::chrono::system_clock::time_point tp);

/**
 * Extract the calendar date from a "struct tm".  The result may be
 * invalid (check year_month_day::ok()) if the "struct tm" was not
 * normalized.
 */
[[gnu::pure]]
std::chrono::year_month_day
ToYearMonthDay(const struct tm &tm) noexcept;

[[gnu::pure]]
inline std::chrono::sys_days
ToSysDays(const struct tm &tm) noexcept
{
	return ToYearMonthDay(tm);
}

#endif
