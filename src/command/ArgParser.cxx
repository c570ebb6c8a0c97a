// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "ArgParser.hxx"
#include "CommandError.hxx"
#include "lib/fmt/ToBuffer.hxx"

#include <cerrno>
#include <limits>

#include <stdlib.h>

static inline CommandError
MakeArgError(const char *msg, const char *value) noexcept
{
	return {CommandErrorCode::ARG, FmtBuffer<256>("{}: {}", msg, value).c_str()};
}

int
ParseCommandArgInt(const char *s, int min_value, int max_value)
{
	char *test;
	errno = 0;
	auto value = strtol(s, &test, 10);
	if (test == s || *test != '\0')
		throw MakeArgError("Integer expected", s);

	if (errno == ERANGE || value < min_value || value > max_value)
		throw MakeArgError("Number out of range", s);

	return (int)value;
}

int
ParseCommandArgInt(const char *s)
{
	return ParseCommandArgInt(s,
				  std::numeric_limits<int>::min(),
				  std::numeric_limits<int>::max());
}

std::int_least64_t
ParseCommandArgLong(const char *s)
{
	char *test;
	errno = 0;
	auto value = strtoll(s, &test, 10);
	if (test == s || *test != '\0')
		throw MakeArgError("Integer expected", s);

	if (errno == ERANGE)
		throw MakeArgError("Number out of range", s);

	return value;
}

unsigned
ParseCommandArgUnsigned(const char *s, unsigned max_value)
{
	return (unsigned)ParseCommandArgInt(s, 0, int(max_value));
}

unsigned
ParseCommandArgPositive(const char *s)
{
	return (unsigned)ParseCommandArgInt(s, 1,
					    std::numeric_limits<int>::max());
}
