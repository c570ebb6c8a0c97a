// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_COMMAND_CONTEXT_HXX
#define MAYACAL_COMMAND_CONTEXT_HXX

#include <chrono>
#include <optional>
#include <string>

struct ConfigData;

/**
 * Settings which affect all commands.  They are collected from the
 * configuration file and the command line.
 */
struct CommandContext {
	static constexpr const char *DEFAULT_DATE_FORMAT = "%Y-%m-%d";

	/**
	 * The strptime() format of Gregorian date arguments.
	 */
	std::string date_format = DEFAULT_DATE_FORMAT;

	/**
	 * Where searches start; std::nullopt means today.
	 */
	std::optional<std::chrono::sys_days> start;

	/**
	 * The number of search results; 0 means one result unless
	 * the command gets an explicit count.
	 */
	unsigned list_size = 0;

	/**
	 * Returns #start or, if that is not set, today.
	 */
	std::chrono::sys_days GetStart() const noexcept;

	/**
	 * Parse a Gregorian date argument with #date_format.
	 *
	 * Throws #Maya::CalendarError (INVALID_DATE) on error.
	 */
	std::chrono::sys_days ParseDate(const char *s) const;
};

/**
 * Build a #CommandContext from the configuration and the
 * command line overrides (which may be nullptr or 0 if not
 * specified).
 *
 * Throws on error.
 */
CommandContext
MakeCommandContext(const ConfigData &config,
		   const char *date_format, const char *start,
		   unsigned list_size);

#endif
