// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#pragma once

#include "io/LineReader.hxx"

#include <string>
#include <string_view>

/**
 * A #LineReader which splits a string into lines.
 */
class StringLineReader final : public LineReader {
	std::string_view input;
	std::string line;

public:
	explicit StringLineReader(std::string_view _input) noexcept
		:input(_input) {}

	char *ReadLine() override {
		if (input.empty())
			return nullptr;

		const auto newline = input.find('\n');
		line = input.substr(0, newline);
		input = newline == input.npos
			? std::string_view{}
			: input.substr(newline + 1);
		return line.data();
	}
};
