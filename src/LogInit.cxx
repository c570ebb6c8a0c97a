// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "LogInit.hxx"
#include "LogBackend.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringAPI.hxx"

#include <stdio.h>

LogLevel
ParseLogLevel(const char *value)
{
	if (StringIsEqual(value, "notice"))
		return LogLevel::NOTICE;
	else if (StringIsEqual(value, "info"))
		return LogLevel::INFO;
	else if (StringIsEqual(value, "verbose"))
		return LogLevel::DEBUG;
	else if (StringIsEqual(value, "warning"))
		return LogLevel::WARNING;
	else if (StringIsEqual(value, "error"))
		return LogLevel::ERROR;
	else
		throw FmtRuntimeError("unknown log level \"{}\"", value);
}

void
log_early_init(bool verbose) noexcept
{
	/* force stderr to be line-buffered */
	setvbuf(stderr, nullptr, _IOLBF, 0);

	if (verbose)
		SetLogThreshold(LogLevel::DEBUG);
}

void
log_init(const ConfigData &config, bool verbose)
{
	if (verbose)
		SetLogThreshold(LogLevel::DEBUG);
	else
		SetLogThreshold(config.With(ConfigOption::LOG_LEVEL, [](const char *s){
			return s != nullptr
				? ParseLogLevel(s)
				: LogLevel::NOTICE;
		}));

	if (config.GetBool(ConfigOption::LOG_TIMESTAMP, false))
		EnableLogTimestamp();
}
