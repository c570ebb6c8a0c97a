// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Tokenizer.hxx"
#include "CharUtil.hxx"
#include "StringStrip.hxx"

#include <stdexcept>

static constexpr bool
IsValidWordFirstChar(char ch) noexcept
{
	return IsAlphaASCII(ch);
}

static constexpr bool
IsValidWordChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) || ch == '_';
}

static constexpr bool
IsValidUnquotedChar(char ch) noexcept
{
	return (unsigned char)ch > 0x20 && ch != '"' && ch != '\'';
}

/**
 * Terminate the token at the current whitespace and skip all
 * following whitespace.
 */
static char *
EndToken(char *p) noexcept
{
	*p = 0;
	return StripLeft(p + 1);
}

char *
Tokenizer::NextWord()
{
	char *const word = input;

	if (*input == 0)
		return nullptr;

	if (!IsValidWordFirstChar(*input))
		throw std::runtime_error("Letter expected");

	while (*++input != 0) {
		if (IsWhitespaceFast(*input)) {
			input = EndToken(input);
			break;
		}

		if (!IsValidWordChar(*input))
			throw std::runtime_error("Invalid word character");
	}

	return word;
}

char *
Tokenizer::NextUnquoted()
{
	char *const word = input;

	if (*input == 0)
		return nullptr;

	if (!IsValidUnquotedChar(*input))
		throw std::runtime_error("Invalid unquoted character");

	while (*++input != 0) {
		if (IsWhitespaceFast(*input)) {
			input = EndToken(input);
			break;
		}

		if (!IsValidUnquotedChar(*input))
			throw std::runtime_error("Invalid unquoted character");
	}

	return word;
}

char *
Tokenizer::NextString()
{
	char *const word = input, *dest = input;

	if (*input == 0)
		/* end of line */
		return nullptr;

	if (*input != '"')
		throw std::runtime_error("'\"' expected");

	++input;

	while (*input != '"') {
		if (*input == '\\')
			/* the backslash escapes the following
			   character */
			++input;

		if (*input == 0)
			throw std::runtime_error("Missing closing '\"'");

		*dest++ = *input++;
	}

	/* the following character must be a whitespace (or end of
	   line) */
	++input;
	if (!IsWhitespaceFast(*input))
		throw std::runtime_error("Space expected after closing '\"'");

	*dest = 0;
	input = StripLeft(input);
	return word;
}

char *
Tokenizer::NextParam()
{
	if (*input == '"')
		return NextString();
	else
		return NextUnquoted();
}
