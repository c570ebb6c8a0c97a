// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_REQUEST_HXX
#define MAYACAL_REQUEST_HXX

#include "ArgParser.hxx"

#include <cassert>
#include <cstdint>
#include <span>

/**
 * The arguments of a command (without the command name).
 */
class Request {
	std::span<const char *const> args;

public:
	explicit constexpr Request(std::span<const char *const> _args) noexcept
		:args(_args) {}

	constexpr bool empty() const noexcept {
		return args.empty();
	}

	constexpr std::size_t size() const noexcept {
		return args.size();
	}

	constexpr const char *front() const noexcept {
		return args.front();
	}

	constexpr const char *shift() noexcept {
		const char *value = args.front();
		args = args.subspan(1);
		return value;
	}

	constexpr const char *operator[](std::size_t i) const noexcept {
		return args[i];
	}

	constexpr auto begin() const noexcept {
		return args.begin();
	}

	constexpr auto end() const noexcept {
		return args.end();
	}

	constexpr const char *GetOptional(unsigned idx,
					  const char *default_value=nullptr) const {
		return idx < size()
			     ? args[idx]
			     : default_value;
	}

	int ParseInt(unsigned idx) const {
		assert(idx < size());
		return ParseCommandArgInt(args[idx]);
	}

	std::int_least64_t ParseLong(unsigned idx) const {
		assert(idx < size());
		return ParseCommandArgLong(args[idx]);
	}

	unsigned ParsePositive(unsigned idx) const {
		assert(idx < size());
		return ParseCommandArgPositive(args[idx]);
	}

	unsigned ParseOptionalPositive(unsigned idx,
				       unsigned default_value) const {
		return idx < size()
			? ParsePositive(idx)
			: default_value;
	}
};

#endif
