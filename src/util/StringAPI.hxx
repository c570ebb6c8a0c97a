// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef STRING_API_HXX
#define STRING_API_HXX

#include <cstddef>

#include <string.h>
#include <strings.h>

[[gnu::pure]] [[gnu::nonnull]]
static inline bool
StringIsEqual(const char *a, const char *b) noexcept
{
	return strcmp(a, b) == 0;
}

[[gnu::pure]] [[gnu::nonnull]]
static inline bool
StringIsEqual(const char *a, const char *b, std::size_t length) noexcept
{
	return strncmp(a, b, length) == 0;
}

/**
 * Checks whether #a and #b are equal, ignoring the case of ASCII
 * letters.
 */
[[gnu::pure]] [[gnu::nonnull]]
static inline bool
StringIsEqualIgnoreCase(const char *a, const char *b) noexcept
{
	return strcasecmp(a, b) == 0;
}

[[gnu::pure]] [[gnu::nonnull]]
static inline bool
StringIsEqualIgnoreCase(const char *a, const char *b,
			std::size_t size) noexcept
{
	return strncasecmp(a, b, size) == 0;
}

#endif
