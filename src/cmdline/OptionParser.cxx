// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "OptionParser.hxx"
#include "OptionDef.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/CharUtil.hxx"
#include "util/StringAPI.hxx"
#include "util/StringCompare.hxx"

static const char *
Shift(std::span<const char *const> &s) noexcept
{
	const char *value = s.front();
	s = s.subspan(1);
	return value;
}

[[gnu::pure]]
static bool
IsOption(const char *s) noexcept
{
	return s[0] == '-' && s[1] != 0 && !IsDigitASCII(s[1]);
}

inline const char *
OptionParser::CheckShiftValue(const char *s, const OptionDef &option)
{
	if (!option.HasValue())
		return nullptr;

	if (args.empty())
		throw FmtRuntimeError("Value expected after {}", s);

	return Shift(args);
}

inline OptionParser::Result
OptionParser::IdentifyOption(const char *s)
{
	assert(s != nullptr);
	assert(*s == '-');

	if (s[1] == '-') {
		for (const auto &i : options) {
			if (!i.HasLongOption())
				continue;

			const char *t = StringAfterPrefix(s + 2, i.GetLongOption());
			if (t == nullptr)
				continue;

			const char *value;

			if (*t == 0)
				value = CheckShiftValue(s, i);
			else if (*t == '=' && i.HasValue())
				value = t + 1;
			else
				continue;

			return {int(&i - options.data()), value};
		}
	} else if (s[2] == 0) {
		const char ch = s[1];
		for (const auto &i : options) {
			if (i.HasShortOption() && ch == i.GetShortOption()) {
				const char *value = CheckShiftValue(s, i);
				return {int(&i - options.data()), value};
			}
		}
	}

	throw FmtRuntimeError("Unknown option: {}", s);
}

OptionParser::Result
OptionParser::Next()
{
	while (!args.empty()) {
		const char *arg = Shift(args);

		if (!end_of_options) {
			if (StringIsEqual(arg, "--")) {
				end_of_options = true;
				continue;
			}

			if (IsOption(arg))
				return IdentifyOption(arg);
		}

		*remaining_tail++ = arg;
	}

	return {-1, nullptr};
}
