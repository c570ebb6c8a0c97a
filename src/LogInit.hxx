// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_LOG_INIT_HXX
#define MAYACAL_LOG_INIT_HXX

#include "LogLevel.hxx"

struct ConfigData;

/**
 * Parse a "log_level" setting.
 *
 * Throws std::runtime_error on error.
 */
LogLevel
ParseLogLevel(const char *value);

void
log_early_init(bool verbose) noexcept;

/**
 * Apply the logging settings from the configuration file.  The
 * "verbose" flag overrides "log_level".
 *
 * Throws on error.
 */
void
log_init(const ConfigData &config, bool verbose);

#endif
