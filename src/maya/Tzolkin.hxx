// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_MAYA_TZOLKIN_HXX
#define MAYACAL_MAYA_TZOLKIN_HXX

#include "Date.hxx"
#include "util/Math.hxx"

#include <array>
#include <chrono>
#include <cstdint>
#include <string_view>

namespace Maya {

/**
 * Traits of the Tzolk'in calendar: the day numbers 1..13 and the 20
 * day names advance in parallel, which makes a cycle of 260 days.
 */
struct Tzolkin {
	static constexpr std::string_view title = "Tzolk'in";
	static constexpr std::string_view keyword = "tzolkin";

	static constexpr unsigned N_NUMBERS = 13;
	static constexpr unsigned N_NAMES = 20;

	static constexpr unsigned CYCLE = N_NUMBERS * N_NAMES;

	static constexpr unsigned MIN_NUMBER = 1;
	static constexpr unsigned MAX_NUMBER = N_NUMBERS;

	/**
	 * "1 Imix".
	 */
	static constexpr Date<Tzolkin> FIRST{1, 1};

	/**
	 * A Gregorian day which was #FIRST.
	 */
	static constexpr std::chrono::sys_days EPOCH{std::chrono::year{2013}/4/1};

	static constexpr std::array<std::string_view, N_NAMES> names{
		"Imix", "Ikʼ", "Akʼbʼal", "Kʼan", "Chikchan", "Kimi",
		"Manikʼ", "Lamat", "Muluk", "Ok", "Chuwen", "Ebʼ", "Bʼen",
		"Ix", "Men", "Kʼibʼ", "Kabʼan", "Etzʼnabʼ", "Kawak", "Ajaw",
	};

	static constexpr bool IsValidNumber(unsigned, unsigned) noexcept {
		return true;
	}

	static constexpr Date<Tzolkin> NextDay(Date<Tzolkin> date) noexcept {
		return {date.number % N_NUMBERS + 1, date.name % N_NAMES + 1};
	}

	static constexpr Date<Tzolkin> AddDays(Date<Tzolkin> date,
					       std::int_least64_t days) noexcept {
		return {
			(date.number - 1 + FloorMod(days, N_NUMBERS)) % N_NUMBERS + 1,
			(date.name - 1 + FloorMod(days, N_NAMES)) % N_NAMES + 1,
		};
	}

	/**
	 * Solve k = a (mod 13) and k = b (mod 20) with the Chinese
	 * remainder theorem.  These are the two coefficients: each
	 * is 1 modulo its own modulus and 0 modulo the other one.
	 */
	static constexpr unsigned CRT_NUMBER = 40, CRT_NAME = 221;
	static_assert(CRT_NUMBER % N_NUMBERS == 1 && CRT_NUMBER % N_NAMES == 0);
	static_assert(CRT_NAME % N_NUMBERS == 0 && CRT_NAME % N_NAMES == 1);

	static constexpr unsigned Diff(Date<Tzolkin> start,
				       Date<Tzolkin> end) noexcept {
		const unsigned a = FloorMod(std::int_least64_t(end.number) - start.number,
					    N_NUMBERS);
		const unsigned b = FloorMod(std::int_least64_t(end.name) - start.name,
					    N_NAMES);
		return (CRT_NUMBER * a + CRT_NAME * b) % CYCLE;
	}
};

} // namespace Maya

#endif
