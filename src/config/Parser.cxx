// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringUtil.hxx"

#include <limits>

#include <stdlib.h>

bool
ParseBool(const char *value)
{
	static const char *const t[] = { "yes", "true", "1", nullptr };
	static const char *const f[] = { "no", "false", "0", nullptr };

	if (StringArrayContainsCase(t, value))
		return true;

	if (StringArrayContainsCase(f, value))
		return false;

	throw FmtRuntimeError(R"(Not a valid boolean ("yes" or "no"): "{}")", value);
}

long
ParseLong(const char *s)
{
	char *endptr;
	long value = strtol(s, &endptr, 10);
	if (endptr == s || *endptr != 0)
		throw std::runtime_error("Failed to parse number");

	return value;
}

unsigned
ParsePositive(const char *s)
{
	auto value = ParseLong(s);
	if (value <= 0)
		throw std::runtime_error("Value must be positive");

	if (value > long(std::numeric_limits<int>::max()))
		throw std::runtime_error("Value is too large");

	return (unsigned)value;
}
