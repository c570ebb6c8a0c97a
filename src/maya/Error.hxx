// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_MAYA_ERROR_HXX
#define MAYACAL_MAYA_ERROR_HXX

#include <fmt/core.h>

#include <stdexcept>
#include <string>

class Domain;

namespace Maya {

enum class CalendarResult {
	/**
	 * The day number is not valid for the calendar (or for the
	 * given month).
	 */
	INVALID_NUMBER,

	/**
	 * The day name (or its number) is unknown.
	 */
	INVALID_NAME,

	/**
	 * The Gregorian date could not be parsed.
	 */
	INVALID_DATE,
};

extern const Domain calendar_domain;

class CalendarError : public std::runtime_error {
	CalendarResult code;

public:
	CalendarError(CalendarResult _code, const char *msg)
		:std::runtime_error(msg), code(_code) {}

	CalendarError(CalendarResult _code, const std::string &msg)
		:std::runtime_error(msg), code(_code) {}

	CalendarResult GetCode() const noexcept {
		return code;
	}
};

[[nodiscard]] [[gnu::pure]]
CalendarError
VFmtCalendarError(CalendarResult code,
		  fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
auto
FmtCalendarError(CalendarResult code,
		 const S &format_str, Args&&... args) noexcept
{
	return VFmtCalendarError(code, format_str,
				 fmt::make_format_args(args...));
}

} // namespace Maya

#endif
