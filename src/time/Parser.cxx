// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Parser.hxx"
#include "Convert.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/CharUtil.hxx"

#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <string_view>

#include <time.h>

std::chrono::sys_days
ParseDate(const char *s, const char *format)
{
	assert(s != nullptr);
	assert(format != nullptr);

#ifdef _WIN32
	/* TODO: emulate strptime()? */
	(void)s;
	(void)format;
	throw std::invalid_argument("Date parsing not implemented on Windows");
#else
	struct tm tm{};
	tm.tm_mday = 1;

	const char *end = strptime(s, format, &tm);
	if (end == nullptr || *end != 0)
		throw FmtInvalidArgument("Failed to parse \"{}\" with format \"{}\"",
					 s, format);

	const auto ymd = ToYearMonthDay(tm);
	if (!ymd.ok())
		throw FmtInvalidArgument("No such day: \"{}\"", s);

	return ymd;
#endif /* !_WIN32 */
}

std::chrono::sys_days
ParseISODate(const char *s)
{
	assert(s != nullptr);

	/* strptime() is too lax: it accepts fields with fewer digits
	   and leading whitespace */
	const std::string_view v{s};
	if (v.size() != 10 || v[4] != '-' || v[7] != '-' ||
	    !std::all_of(v.begin(), v.begin() + 4, IsDigitASCII) ||
	    !std::all_of(v.begin() + 5, v.begin() + 7, IsDigitASCII) ||
	    !std::all_of(v.begin() + 8, v.end(), IsDigitASCII))
		throw FmtInvalidArgument("Not an ISO 8601 date (YYYY-MM-DD): \"{}\"",
					 s);

	return ParseDate(s, "%Y-%m-%d");
}
