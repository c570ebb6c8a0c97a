// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_CONFIG_OPTION_HXX
#define MAYACAL_CONFIG_OPTION_HXX

enum class ConfigOption {
	LOG_LEVEL,
	LOG_TIMESTAMP,
	DATE_FORMAT,
	LIST_SIZE,
	START_DATE,
	MAX
};

/**
 * @return #ConfigOption::MAX if not found
 */
[[gnu::pure]]
ConfigOption
ParseConfigOptionName(const char *name) noexcept;

#endif
