// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_COMMAND_ARG_PARSER_HXX
#define MAYACAL_COMMAND_ARG_PARSER_HXX

#include <cstdint>

/*
 * These functions throw #CommandError (CommandErrorCode::ARG) on
 * error.
 */

int
ParseCommandArgInt(const char *s, int min_value, int max_value);

int
ParseCommandArgInt(const char *s);

std::int_least64_t
ParseCommandArgLong(const char *s);

unsigned
ParseCommandArgUnsigned(const char *s, unsigned max_value);

unsigned
ParseCommandArgPositive(const char *s);

#endif
