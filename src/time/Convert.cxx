// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Convert.hxx"

#include <stdexcept>

#include <time.h>

struct tm
LocalTime(std::chrono::system_clock::time_point tp)
{
	const time_t t = std::chrono::system_clock::to_time_t(tp);
#ifdef _WIN32
	const struct tm *tm = localtime(&t);
#else
	struct tm buffer, *tm = localtime_r(&t, &buffer);
#endif
	if (tm == nullptr)
		throw std::runtime_error("localtime_r() failed");

	return *tm;
}

std::chrono::year_month_day
ToYearMonthDay(const struct tm &tm) noexcept
{
	return {
		std::chrono::year{tm.tm_year + 1900},
		std::chrono::month(tm.tm_mon + 1),
		std::chrono::day(tm.tm_mday),
	};
}
