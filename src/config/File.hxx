// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_CONFIG_FILE_HXX
#define MAYACAL_CONFIG_FILE_HXX

struct ConfigData;
class LineReader;

/**
 * Parse configuration lines from the given reader.
 *
 * Throws on error, with the line number nested.
 */
void
ReadConfigFile(ConfigData &data, LineReader &reader);

/**
 * Throws on error.
 */
void
ReadConfigFile(ConfigData &data, const char *path);

#endif
