// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_MAYA_LOOKUP_TABLE_HXX
#define MAYACAL_MAYA_LOOKUP_TABLE_HXX

#include "Date.hxx"

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>

namespace Maya {

/**
 * All days of one cycle of a calendar system, in order, and the
 * inverse mapping from a #Date to its offset within the cycle.
 */
template<typename System>
class LookupTable {
	static constexpr std::uint_least16_t NONE = 0xffff;
	static_assert(System::CYCLE < NONE);

	static constexpr std::size_t N_NUMBERS = System::MAX_NUMBER + 1;
	static constexpr std::size_t N_NAMES = System::N_NAMES + 1;

	std::array<Date<System>, System::CYCLE> dates;

	/**
	 * Maps number/name to the offset, or #NONE if there is no
	 * such day.
	 */
	std::array<std::uint_least16_t, N_NUMBERS * N_NAMES> offsets;

	static constexpr std::size_t Index(Date<System> date) noexcept {
		return date.number * N_NAMES + date.name;
	}

public:
	using const_iterator = typename decltype(dates)::const_iterator;

	/**
	 * Generate the table by walking the whole cycle, starting at
	 * System::FIRST.
	 */
	LookupTable() noexcept {
		offsets.fill(NONE);

		auto date = System::FIRST;
		for (unsigned offset = 0; offset < System::CYCLE; ++offset) {
			assert(offsets[Index(date)] == NONE);

			dates[offset] = date;
			offsets[Index(date)] = offset;
			date = System::NextDay(date);
		}

		/* the cycle is closed */
		assert(date == System::FIRST);
	}

	LookupTable(const LookupTable &) = delete;
	LookupTable &operator=(const LookupTable &) = delete;

	static constexpr std::size_t size() noexcept {
		return System::CYCLE;
	}

	const_iterator begin() const noexcept {
		return dates.begin();
	}

	const_iterator end() const noexcept {
		return dates.end();
	}

	Date<System> operator[](unsigned offset) const noexcept {
		assert(offset < System::CYCLE);

		return dates[offset];
	}

	/**
	 * Is this a day of the cycle?  Out-of-range components are
	 * allowed here.
	 */
	[[gnu::pure]]
	bool Contains(Date<System> date) const noexcept {
		return date.number <= System::MAX_NUMBER &&
			date.name <= System::N_NAMES &&
			offsets[Index(date)] != NONE;
	}

	/**
	 * Returns the position of the given day within the cycle.
	 * The day must be valid.
	 */
	[[gnu::pure]]
	unsigned GetOffset(Date<System> date) const noexcept {
		assert(Contains(date));

		return offsets[Index(date)];
	}
};

/**
 * Returns the process-wide #LookupTable of the given calendar
 * system.  It is built on the first call (the C++ runtime guarantees
 * that this happens only once, even with concurrent callers) and is
 * read-only afterwards.
 */
template<typename System>
[[gnu::const]]
const LookupTable<System> &
GetLookupTable() noexcept
{
	static const LookupTable<System> table;
	return table;
}

} // namespace Maya

#endif
