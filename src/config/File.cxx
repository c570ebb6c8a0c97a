// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "File.hxx"
#include "Data.hxx"
#include "Param.hxx"
#include "Templates.hxx"
#include "io/FileLineReader.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "util/StringStrip.hxx"
#include "util/Tokenizer.hxx"
#include "Log.hxx"

#include <cassert>

static constexpr char CONF_COMMENT = '#';

static constexpr Domain config_file_domain("config_file");

/**
 * Read a string value as the last token of a line.  Throws on error.
 */
static auto
ExpectValueAndEnd(Tokenizer &tokenizer)
{
	auto value = tokenizer.NextParam();
	if (!value)
		throw std::runtime_error("Value missing");

	if (!tokenizer.IsEnd() && tokenizer.CurrentChar() != CONF_COMMENT)
		throw std::runtime_error("Unknown tokens after value");

	return value;
}

static void
ReadConfigParam(ConfigData &config_data, unsigned line,
		const char *name, ConfigOption o,
		Tokenizer &tokenizer)
{
	const auto i = unsigned(o);
	const ConfigTemplate &option = config_param_templates[i];

	if (option.deprecated)
		FmtWarning(config_file_domain,
			   "config parameter \"{}\" on line {} is deprecated",
			   name, line);

	if (!option.repeatable) {
		/* if the option is not repeatable, override the old
		   value by removing it first */
		if (const auto *old = config_data.GetParam(o))
			FmtDebug(config_file_domain,
				 "config parameter \"{}\" on line {} overrides line {}",
				 name, line, old->line);

		config_data.GetParamList(o).clear();
	}

	config_data.AddParam(o, ConfigParam(ExpectValueAndEnd(tokenizer),
					    int(line)));
}

void
ReadConfigFile(ConfigData &config_data, LineReader &reader)
{
	unsigned line_number = 0;

	try {
		while (true) {
			++line_number;

			char *line = reader.ReadLine();
			if (line == nullptr)
				return;

			line = StripLeft(line);
			if (*line == 0 || *line == CONF_COMMENT)
				continue;

			/* the first token in each line is the name,
			   followed by the value */

			Tokenizer tokenizer(line);
			const char *name = tokenizer.NextWord();
			assert(name != nullptr);

			const ConfigOption o = ParseConfigOptionName(name);
			if (o == ConfigOption::MAX)
				throw FmtRuntimeError("unrecognized parameter: {}",
						      name);

			ReadConfigParam(config_data, line_number, name, o,
					tokenizer);
		}
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error on line {}",
						       line_number));
	}
}

void
ReadConfigFile(ConfigData &config_data, const char *path)
{
	assert(path != nullptr);

	FmtDebug(config_file_domain, "loading file {}", path);

	FileLineReader reader(path);

	try {
		ReadConfigFile(config_data, reader);
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error in {}", path));
	}
}
