// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef STRING_UTIL_HXX
#define STRING_UTIL_HXX

/**
 * Checks whether a string array contains the specified string,
 * ignoring the case of ASCII letters.
 *
 * @param haystack a nullptr terminated list of strings
 * @param needle the string to search for
 */
[[gnu::pure]] [[gnu::nonnull]]
bool
StringArrayContainsCase(const char *const*haystack,
			const char *needle) noexcept;

#endif
