// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#pragma once

#include "LineReader.hxx"

#include <string>

#include <stdio.h>

/**
 * A #LineReader implementation which reads a text file with stdio.
 */
class FileLineReader final : public LineReader {
	static constexpr std::size_t MAX_LENGTH = 64 * 1024;

	FILE *const file;

	std::string buffer;

public:
	/**
	 * Throws std::runtime_error if the file cannot be opened.
	 */
	explicit FileLineReader(const char *path);

	~FileLineReader() noexcept override {
		fclose(file);
	}

	FileLineReader(const FileLineReader &) = delete;
	FileLineReader &operator=(const FileLineReader &) = delete;

	/* virtual methods from class LineReader */
	char *ReadLine() override;
};
