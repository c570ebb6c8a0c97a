// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "config.h"
#include "CommandLine.hxx"
#include "LogInit.hxx"
#include "Log.hxx"
#include "cmdline/OptionDef.hxx"
#include "cmdline/OptionParser.hxx"
#include "command/AllCommands.hxx"
#include "command/Response.hxx"
#include "config/File.hxx"
#include "config/Parser.hxx"
#include "io/StdioOutputStream.hxx"
#include "util/Domain.hxx"

#include <stdexcept>
#include <string>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

static constexpr const char *CONFIG_FILE_NAME = "mayacal.conf";

enum Option {
	OPTION_START,
	OPTION_FORMAT,
	OPTION_COUNT,
	OPTION_CONFIG,
	OPTION_NO_CONFIG,
	OPTION_VERBOSE,
	OPTION_VERSION,
	OPTION_HELP,
	OPTION_HELP2,
};

static constexpr OptionDef option_defs[] = {
	{"start", 's', true, "start searching at this date (default: today)"},
	{"format", 'f', true, "strptime() format of date arguments"},
	{"count", 'n', true, "number of search results"},
	{"config", 'c', true, "read this configuration file"},
	{"no-config", "don't read from config"},
	{"verbose", 'v', "verbose logging"},
	{"version", 'V', "print version number"},
	{"help", 'h', "show help options"},
	{nullptr, '?', nullptr}, // hidden, standard alias for --help
};

static constexpr Domain cmdline_domain("cmdline");

[[noreturn]]
static void version()
{
	printf(PACKAGE " " VERSION "\n"
	       "Haab' and Tzolk'in calendar calculator.\n"
	       "This is free software; see the source for copying conditions.  There is NO\n"
	       "warranty; not even MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.\n");

	std::exit(EXIT_SUCCESS);
}

static void PrintOption(const OptionDef &opt)
{
	if (opt.HasShortOption())
		printf("  -%c, --%-12s%s\n",
		       opt.GetShortOption(),
		       opt.GetLongOption(),
		       opt.GetDescription());
	else
		printf("  --%-16s%s\n",
		       opt.GetLongOption(),
		       opt.GetDescription());
}

[[noreturn]]
static void help()
{
	printf("Usage:\n"
	       "  " PACKAGE " [OPTION...] COMMAND [ARG...]\n"
	       "\n"
	       "Convert between Gregorian dates and the Haab' and Tzolk'in calendars.\n"
	       "SYSTEM is \"haab\" or \"tzolkin\", DATE is a Gregorian date.\n"
	       "\n"
	       "Options:\n");

	for (const auto &i : option_defs)
		if (i.HasDescription()) // hide hidden options from help print
			PrintOption(i);

	printf("\n"
	       "Commands:\n");

	StdioOutputStream os(stdout);
	Response r(os);
	command_print_usage(r);

	std::exit(EXIT_SUCCESS);
}

/**
 * Determine the path of the default configuration file:
 * $XDG_CONFIG_HOME/mayacal.conf or ~/.config/mayacal.conf.
 */
static std::string
GetDefaultConfigPath() noexcept
{
	if (const char *xdg = getenv("XDG_CONFIG_HOME");
	    xdg != nullptr && *xdg != 0)
		return std::string{xdg} + "/" + CONFIG_FILE_NAME;

	if (const char *home = getenv("HOME");
	    home != nullptr && *home != 0)
		return std::string{home} + "/.config/" + CONFIG_FILE_NAME;

	return {};
}

static bool
TryConfigFile(ConfigData &config, const char *path)
{
	if (access(path, F_OK) != 0)
		return false;

	ReadConfigFile(config, path);
	return true;
}

void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options,
		 ConfigData &config)
{
	bool use_config_file = true;
	const char *config_file = nullptr;

	OptionParser parser(option_defs, argc, argv);
	while (auto o = parser.Next()) {
		switch (Option(o.index)) {
		case OPTION_START:
			options.start = o.value;
			break;

		case OPTION_FORMAT:
			options.date_format = o.value;
			break;

		case OPTION_COUNT:
			try {
				options.count = ParsePositive(o.value);
			} catch (...) {
				std::throw_with_nested(std::runtime_error("Bad --count value"));
			}
			break;

		case OPTION_CONFIG:
			config_file = o.value;
			break;

		case OPTION_NO_CONFIG:
			use_config_file = false;
			break;

		case OPTION_VERBOSE:
			options.verbose = true;
			break;

		case OPTION_VERSION:
			version();

		case OPTION_HELP:
		case OPTION_HELP2:
			help();
		}
	}

	options.args = parser.GetRemaining();

	/* initialize the logging library, so the configuration file
	   parser can use it already */
	log_early_init(options.verbose);

	if (!use_config_file) {
		LogDebug(cmdline_domain,
			 "Ignoring config, using defaults");
		return;
	}

	if (config_file != nullptr) {
		/* use specified configuration file */
		ReadConfigFile(config, config_file);
		return;
	}

	/* use default configuration file path; it is optional */

	const auto path = GetDefaultConfigPath();
	if (path.empty() || !TryConfigFile(config, path.c_str()))
		LogDebug(cmdline_domain, "No configuration file found");
}
