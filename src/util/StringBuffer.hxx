// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <array>
#include <cstddef>
#include <string_view>

/**
 * A statically allocated string buffer.
 */
template<std::size_t CAPACITY>
class StringBuffer {
public:
	using value_type = char;
	using pointer = char *;
	using const_pointer = const char *;
	using size_type = std::size_t;

	static constexpr value_type SENTINEL = '\0';

private:
	std::array<value_type, CAPACITY> the_data;

public:
	static constexpr size_type capacity() noexcept {
		return CAPACITY;
	}

	constexpr bool empty() const noexcept {
		return the_data.front() == SENTINEL;
	}

	constexpr const_pointer c_str() const noexcept {
		return the_data.data();
	}

	constexpr pointer data() noexcept {
		return the_data.data();
	}

	constexpr operator const_pointer() const noexcept {
		return c_str();
	}

	constexpr operator std::string_view() const noexcept {
		return c_str();
	}
};
