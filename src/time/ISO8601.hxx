// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#ifndef TIME_ISO8601_HXX
#define TIME_ISO8601_HXX

#include <chrono>
#include <cstddef>

template<std::size_t CAPACITY> class StringBuffer;

/**
 * Format a calendar date as "YYYY-MM-DD".  Years outside 0..9999
 * get a sign and/or more digits.
 */
[[gnu::pure]]
StringBuffer<16>
FormatISODate(std::chrono::year_month_day ymd) noexcept;

[[gnu::pure]]
StringBuffer<16>
FormatISODate(std::chrono::sys_days day) noexcept;

#endif
