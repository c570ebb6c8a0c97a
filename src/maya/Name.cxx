// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "Name.hxx"
#include "util/CharUtil.hxx"
#include "util/StringCompare.hxx"

#include <algorithm>

namespace Maya {

unsigned
FindName(std::span<const std::string_view> names,
	 std::string_view s) noexcept
{
	const auto i = std::find_if(names.begin(), names.end(),
				    [s](std::string_view name){
					    return StringIsEqualIgnoreCase(name, s);
				    });
	return i != names.end()
		? unsigned(std::distance(names.begin(), i)) + 1
		: 0;
}

/**
 * Compare two strings, skipping everything but ASCII letters and
 * digits and ignoring the case of letters.
 */
[[gnu::pure]]
static bool
AlphaNumericEqualsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	auto i = a.begin(), j = b.begin();

	while (true) {
		i = std::find_if(i, a.end(), IsAlphaNumericASCII);
		j = std::find_if(j, b.end(), IsAlphaNumericASCII);

		if (i == a.end() || j == b.end())
			return i == a.end() && j == b.end();

		if (ToUpperASCII(*i) != ToUpperASCII(*j))
			return false;

		++i;
		++j;
	}
}

unsigned
FindNameTolerant(std::span<const std::string_view> names,
		 std::string_view s) noexcept
{
	const auto i = std::find_if(names.begin(), names.end(),
				    [s](std::string_view name){
					    return AlphaNumericEqualsIgnoreCase(name, s);
				    });
	return i != names.end()
		? unsigned(std::distance(names.begin(), i)) + 1
		: 0;
}

} // namespace Maya
