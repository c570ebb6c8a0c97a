// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "StringUtil.hxx"
#include "StringAPI.hxx"

bool
StringArrayContainsCase(const char *const*haystack,
			const char *needle) noexcept
{
	for (; *haystack != nullptr; ++haystack)
		if (StringIsEqualIgnoreCase(*haystack, needle))
			return true;

	return false;
}
