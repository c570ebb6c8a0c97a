// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_MAYA_FORMAT_HXX
#define MAYACAL_MAYA_FORMAT_HXX

#include "Date.hxx"
#include "LookupTable.hxx"
#include "Name.hxx"

#include <fmt/format.h>

#include <iterator>
#include <string>
#include <vector>

/**
 * Formats a #Maya::Date as "<number> <name>", e.g. "0 Pop".
 */
template<typename System>
struct fmt::formatter<Maya::Date<System>> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(const Maya::Date<System> &date, FormatContext &ctx) const {
		fmt::memory_buffer buffer;
		fmt::format_to(std::back_inserter(buffer), "{} {}",
			       date.number, Maya::GetName<System>(date.name));
		return formatter<string_view>::format({buffer.data(), buffer.size()},
						      ctx);
	}
};

namespace Maya {

template<typename System>
std::string
ToString(Date<System> date)
{
	return fmt::format("{}", date);
}

/**
 * Format all days of the cycle, in order.
 */
template<typename System>
std::vector<std::string>
ListCalendar()
{
	const auto &table = GetLookupTable<System>();

	std::vector<std::string> result;
	result.reserve(table.size());
	for (const auto date : table)
		result.emplace_back(ToString(date));
	return result;
}

} // namespace Maya

#endif
