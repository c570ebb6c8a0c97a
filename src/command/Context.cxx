// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "Context.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "maya/Gregorian.hxx"

std::chrono::sys_days
CommandContext::GetStart() const noexcept
{
	return start ? *start : Maya::Today();
}

std::chrono::sys_days
CommandContext::ParseDate(const char *s) const
{
	return Maya::ParseGregorian(s, date_format.c_str());
}

CommandContext
MakeCommandContext(const ConfigData &config,
		   const char *date_format, const char *start,
		   unsigned list_size)
{
	CommandContext context;

	if (date_format == nullptr)
		date_format = config.GetString(ConfigOption::DATE_FORMAT);
	if (date_format != nullptr)
		context.date_format = date_format;

	if (start != nullptr)
		context.start = context.ParseDate(start);
	else
		context.start = config.With(ConfigOption::START_DATE,
					    [&context](const char *s) -> std::optional<std::chrono::sys_days> {
			if (s == nullptr)
				return std::nullopt;

			return context.ParseDate(s);
		});

	context.list_size = list_size > 0
		? list_size
		: config.GetPositive(ConfigOption::LIST_SIZE, 0);

	return context;
}
