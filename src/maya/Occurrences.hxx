// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_MAYA_OCCURRENCES_HXX
#define MAYACAL_MAYA_OCCURRENCES_HXX

#include <cassert>
#include <chrono>
#include <cstddef>
#include <iterator>

namespace Maya {

/**
 * A finite sequence of Gregorian days with a constant distance,
 * i.e. the recurrences of one calendar date.  The days are
 * calculated on the fly; the range can be iterated any number of
 * times.
 */
class OccurrenceRange {
	std::chrono::sys_days first;

	/**
	 * The distance between two days; negative when searching
	 * backwards.
	 */
	std::chrono::days step;

	std::size_t n;

public:
	constexpr OccurrenceRange() noexcept
		:first(), step(), n(0) {}

	constexpr OccurrenceRange(std::chrono::sys_days _first,
				  std::chrono::days _step,
				  std::size_t _n) noexcept
		:first(_first), step(_step), n(_n) {}

	class const_iterator {
		std::chrono::sys_days first;
		std::chrono::days step;
		std::size_t i;

	public:
		using iterator_category = std::forward_iterator_tag;
		using value_type = std::chrono::sys_days;
		using difference_type = std::ptrdiff_t;
		using pointer = const value_type *;
		using reference = value_type;

		constexpr const_iterator() noexcept
			:first(), step(), i(0) {}

		constexpr const_iterator(std::chrono::sys_days _first,
					 std::chrono::days _step,
					 std::size_t _i) noexcept
			:first(_first), step(_step), i(_i) {}

		constexpr value_type operator*() const noexcept {
			return first + step * std::chrono::days::rep(i);
		}

		constexpr const_iterator &operator++() noexcept {
			++i;
			return *this;
		}

		constexpr const_iterator operator++(int) noexcept {
			auto old = *this;
			++i;
			return old;
		}

		constexpr bool operator==(const const_iterator &other) const noexcept {
			return i == other.i;
		}
	};

	constexpr bool empty() const noexcept {
		return n == 0;
	}

	constexpr std::size_t size() const noexcept {
		return n;
	}

	constexpr std::chrono::sys_days front() const noexcept {
		assert(!empty());

		return first;
	}

	constexpr std::chrono::sys_days operator[](std::size_t i) const noexcept {
		assert(i < n);

		return first + step * std::chrono::days::rep(i);
	}

	constexpr const_iterator begin() const noexcept {
		return {first, step, 0};
	}

	constexpr const_iterator end() const noexcept {
		return {first, step, n};
	}
};

} // namespace Maya

#endif
