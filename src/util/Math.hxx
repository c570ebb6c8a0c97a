// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef MATH_HXX
#define MATH_HXX

#include <cstdint>

/**
 * The remainder of a floored division: unlike the "%" operator, the
 * result is never negative, i.e. FloorMod(-1, 7) is 6.
 *
 * @param m the (non-zero) modulus
 */
[[gnu::const]]
constexpr unsigned
FloorMod(std::int_least64_t a, unsigned m) noexcept
{
	const std::int_least64_t r = a % std::int_least64_t(m);
	return unsigned(r < 0 ? r + std::int_least64_t(m) : r);
}

#endif
