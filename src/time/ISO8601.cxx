// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ISO8601.hxx"
#include "lib/fmt/ToBuffer.hxx"
#include "util/StringBuffer.hxx"

StringBuffer<16>
FormatISODate(std::chrono::year_month_day ymd) noexcept
{
	return FmtBuffer<16>("{:04}-{:02}-{:02}",
			     int(ymd.year()),
			     unsigned(ymd.month()),
			     unsigned(ymd.day()));
}

StringBuffer<16>
FormatISODate(std::chrono::sys_days day) noexcept
{
	return FormatISODate(std::chrono::year_month_day{day});
}
