// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "FileLineReader.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringStrip.hxx"

#include <errno.h>
#include <string.h>

static FILE *
OpenTextFile(const char *path)
{
	FILE *file = fopen(path, "r");
	if (file == nullptr)
		throw FmtRuntimeError("Failed to open \"{}\": {}",
				      path, strerror(errno));

	return file;
}

FileLineReader::FileLineReader(const char *path)
	:file(OpenTextFile(path))
{
}

char *
FileLineReader::ReadLine()
{
	buffer.clear();

	int ch;
	while ((ch = getc(file)) != EOF) {
		if (ch == '\n')
			break;

		if (buffer.size() >= MAX_LENGTH)
			throw std::runtime_error("Line is too long");

		buffer.push_back(char(ch));
	}

	if (ferror(file))
		throw std::runtime_error("Failed to read from file");

	if (ch == EOF && buffer.empty())
		return nullptr;

	StripRight(buffer.data());
	return buffer.data();
}
