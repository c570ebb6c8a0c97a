// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "lib/fmt/ToBuffer.hxx"
#include "util/Domain.hxx"
#include "util/StringStrip.hxx"

#include <fmt/chrono.h>

#include <stdio.h>
#include <time.h>

using std::string_view_literals::operator""sv;

static LogLevel log_threshold = LogLevel::NOTICE;

static bool enable_timestamp;

void
SetLogThreshold(LogLevel _threshold) noexcept
{
	log_threshold = _threshold;
}

void
EnableLogTimestamp() noexcept
{
	enable_timestamp = true;
}

static StringBuffer<32>
log_date() noexcept
{
	StringBuffer<32> buffer;
	buffer.data()[0] = 0;

	const time_t t = time(nullptr);
	struct tm tm;
	if (localtime_r(&t, &tm) == nullptr)
		return buffer;

	return FmtBuffer<32>("{:%FT%T} ", tm);
}

static void
FileLog(const Domain &domain, std::string_view message) noexcept
{
	fmt::print(stderr, "{}{}: {}\n",
		   enable_timestamp ? std::string_view{log_date()} : ""sv,
		   domain.GetName(),
		   StripRight(message));
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (level < log_threshold)
		return;

	FileLog(domain, msg);
}
