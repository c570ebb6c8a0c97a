// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "Error.hxx"
#include "util/Domain.hxx"

#include <fmt/format.h>

namespace Maya {

const Domain calendar_domain("calendar");

CalendarError
VFmtCalendarError(CalendarResult code,
		  fmt::string_view format_str, fmt::format_args args) noexcept
{
	return CalendarError(code, fmt::vformat(format_str, args));
}

} // namespace Maya
