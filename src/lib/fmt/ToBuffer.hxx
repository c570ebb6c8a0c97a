// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "util/StringBuffer.hxx"

#include <fmt/core.h>

/**
 * Format into a fixed-size #StringBuffer.  The result is truncated
 * if it does not fit.
 */
template<std::size_t size>
[[nodiscard]] [[gnu::pure]]
auto
VFmtBuffer(fmt::string_view format_str, fmt::format_args args) noexcept
{
	StringBuffer<size> buffer;
	auto result = fmt::vformat_to_n(buffer.data(), buffer.capacity() - 1,
					format_str, args);
	*result.out = '\0';
	return buffer;
}

template<std::size_t size, typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
auto
FmtBuffer(const S &format_str, Args&&... args) noexcept
{
	return VFmtBuffer<size>(format_str, fmt::make_format_args(args...));
}
