// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_COMMAND_LINE_HXX
#define MAYACAL_COMMAND_LINE_HXX

#include <span>

struct ConfigData;

struct CommandLineOptions {
	bool verbose = false;

	/**
	 * Overrides "date_format" from the configuration file.
	 */
	const char *date_format = nullptr;

	/**
	 * Overrides "start_date" from the configuration file.
	 */
	const char *start = nullptr;

	/**
	 * Overrides "list_size"; 0 means not specified.
	 */
	unsigned count = 0;

	/**
	 * The command name followed by its arguments.
	 */
	std::span<const char *const> args;
};

/**
 * Parse the command line and load the configuration file.
 *
 * Throws on error.
 */
void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config);

#endif
