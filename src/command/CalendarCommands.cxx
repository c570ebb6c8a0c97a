// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "CalendarCommands.hxx"
#include "CommandError.hxx"
#include "Context.hxx"
#include "Request.hxx"
#include "Response.hxx"
#include "maya/Day.hxx"
#include "lib/fmt/ToBuffer.hxx"
#include "time/ISO8601.hxx"
#include "util/CharUtil.hxx"
#include "util/StringBuffer.hxx"
#include "util/StringCompare.hxx"

#include <algorithm>
#include <string_view>

using Maya::Haab;
using Maya::Tzolkin;

/**
 * Invoke the template call operator of #f with the calendar system
 * whose keyword is #name.
 *
 * Throws #CommandError if there is no such calendar.
 */
template<typename F>
static void
WithSystem(const char *name, F &&f)
{
	if (StringIsEqual(name, Haab::keyword))
		f.template operator()<Haab>();
	else if (StringIsEqual(name, Tzolkin::keyword))
		f.template operator()<Tzolkin>();
	else
		throw CommandError(CommandErrorCode::ARG,
				   FmtBuffer<256>("Unknown calendar \"{}\", expected \"{}\" or \"{}\"",
						  name, Haab::keyword,
						  Tzolkin::keyword).c_str());
}

[[gnu::pure]]
static bool
IsNumber(std::string_view s) noexcept
{
	return !s.empty() && std::all_of(s.begin(), s.end(), IsDigitASCII);
}

/**
 * Parse a day number and a day name (or its number) from two
 * consecutive arguments.  The name is matched with
 * Maya::ParseName(), i.e. "Wayeb'" and "kankin" are accepted.
 *
 * Throws #CommandError or #Maya::CalendarError.
 */
template<typename System>
static Maya::Day<System>
ParseDayArgs(const Request &args, unsigned idx)
{
	const int number = args.ParseInt(idx);
	const char *name = args[idx + 1];

	if (IsNumber(name))
		return {number, args.ParseInt(idx + 1)};

	return {number, int(Maya::ParseNameNumber<System>(name))};
}

/**
 * Returns the Gregorian day from the optional argument, or today.
 */
static std::chrono::sys_days
GetDayArg(const CommandContext &context, const Request &args, unsigned idx)
{
	const char *s = args.GetOptional(idx);
	return s != nullptr
		? context.ParseDate(s)
		: Maya::Today();
}

template<typename System>
static void
PrintGregorian(const CommandContext &context, Request args, Response &r)
{
	const auto day = Maya::Day<System>::FromDate(GetDayArg(context, args, 0));
	r.Fmt("{}\n", day.ToString());
}

static void
PrintOccurrences(Response &r, const Maya::OccurrenceRange &dates)
{
	for (const auto day : dates)
		r.Fmt("{}\n", FormatISODate(day).c_str());
}

/**
 * The number of results of "next" and "last": an explicit argument,
 * or the configured list size, or one.
 */
static int
GetCount(const CommandContext &context, const Request &args, unsigned idx)
{
	return int(args.ParseOptionalPositive(idx, context.list_size > 0
					      ? context.list_size
					      : 1));
}

void
handle_add([[maybe_unused]] const CommandContext &context,
	   Request args, Response &r)
{
	WithSystem(args.shift(), [&]<typename System>(){
		auto day = ParseDayArgs<System>(args, 0);
		day.AddDays(args.ParseLong(2));
		r.Fmt("{}\n", day.ToString());
	});
}

void
handle_calendar([[maybe_unused]] const CommandContext &context,
		Request args, Response &r)
{
	WithSystem(args.front(), [&]<typename System>(){
		for (const auto &i : Maya::Day<System>::GetCalendar())
			r.Fmt("{}\n", i);
	});
}

void
handle_convert(const CommandContext &context, Request args, Response &r)
{
	const auto day = GetDayArg(context, args, 0);

	r.Fmt("date: {}\n", FormatISODate(day).c_str());
	r.Fmt("haab: {}\n", Maya::HaabDay::FromDate(day).ToString());
	r.Fmt("tzolkin: {}\n", Maya::TzolkinDay::FromDate(day).ToString());
}

void
handle_diff([[maybe_unused]] const CommandContext &context,
	    Request args, Response &r)
{
	WithSystem(args.shift(), [&]<typename System>(){
		const auto start = ParseDayArgs<System>(args, 0);
		const auto end = ParseDayArgs<System>(args, 2);
		r.Fmt("{}\n", start.GetDayDiff(end));
	});
}

void
handle_haab(const CommandContext &context, Request args, Response &r)
{
	PrintGregorian<Haab>(context, args, r);
}

void
handle_info([[maybe_unused]] const CommandContext &context,
	    Request args, Response &r)
{
	WithSystem(args.shift(), [&]<typename System>(){
		const auto day = ParseDayArgs<System>(args, 0);
		r.Fmt("date: {}\n", day.ToString());
		r.Fmt("number: {}\n", day.GetDayNumber());
		r.Fmt("name: {}\n", day.GetDayName());
		r.Fmt("name_number: {}\n", day.GetDayNameNumber());
		r.Fmt("cycle_day: {}\n", day.GetCycleDay());
	});
}

void
handle_last(const CommandContext &context, Request args, Response &r)
{
	WithSystem(args.shift(), [&]<typename System>(){
		const auto day = ParseDayArgs<System>(args, 0);
		PrintOccurrences(r, day.GetLastDateList(context.GetStart(),
							GetCount(context, args, 2)));
	});
}

void
handle_next(const CommandContext &context, Request args, Response &r)
{
	WithSystem(args.shift(), [&]<typename System>(){
		const auto day = ParseDayArgs<System>(args, 0);
		PrintOccurrences(r, day.GetNextDateList(context.GetStart(),
							GetCount(context, args, 2)));
	});
}

void
handle_parse([[maybe_unused]] const CommandContext &context,
	     Request args, Response &r)
{
	WithSystem(args[0], [&]<typename System>(){
		r.Fmt("{}\n", Maya::Day<System>::ParseName(args[1]));
	});
}

void
handle_tzolkin(const CommandContext &context, Request args, Response &r)
{
	PrintGregorian<Tzolkin>(context, args, r);
}
