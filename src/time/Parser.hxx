// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#ifndef TIME_PARSER_HXX
#define TIME_PARSER_HXX

#include <chrono>

/**
 * Parse a calendar date with a strptime() format string.  Fields
 * missing from the format default to 1900-01-01.  The whole string
 * must be consumed.
 *
 * Throws std::invalid_argument on error.
 */
std::chrono::sys_days
ParseDate(const char *s, const char *format);

/**
 * Parse a calendar date in the strict ISO 8601 form "YYYY-MM-DD".
 *
 * Throws std::invalid_argument on error.
 */
std::chrono::sys_days
ParseISODate(const char *s);

#endif
