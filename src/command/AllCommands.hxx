// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_ALL_COMMANDS_HXX
#define MAYACAL_ALL_COMMANDS_HXX

#include <span>

struct CommandContext;
class Response;

void
command_init() noexcept;

/**
 * Print the list of commands with their arguments.
 */
void
command_print_usage(Response &r);

/**
 * Look up and invoke a command.  The first element of #argv is the
 * command name.
 *
 * Throws #CommandError if the command line is not understood, and
 * #Maya::CalendarError or other exceptions if the command fails.
 */
void
command_process(const CommandContext &context,
		std::span<const char *const> argv, Response &r);

#endif
