// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_COMMAND_ERROR_HXX
#define MAYACAL_COMMAND_ERROR_HXX

#include <stdexcept>
#include <utility>

enum class CommandErrorCode {
	/**
	 * No such command.
	 */
	UNKNOWN,

	/**
	 * Wrong number of arguments, or a malformed argument.
	 */
	ARG,
};

/**
 * The command line was not understood.  This is different from a
 * #Maya::CalendarError, which means that the values themselves are
 * not valid.
 */
class CommandError : public std::runtime_error {
	CommandErrorCode code;

public:
	template<typename M>
	CommandError(CommandErrorCode _code, M &&msg) noexcept
		:std::runtime_error(std::forward<M>(msg)), code(_code) {}

	CommandErrorCode GetCode() const noexcept {
		return code;
	}
};

#endif
