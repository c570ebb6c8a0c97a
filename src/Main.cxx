// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "CommandLine.hxx"
#include "Log.hxx"
#include "LogInit.hxx"
#include "command/AllCommands.hxx"
#include "command/CommandError.hxx"
#include "command/Context.hxx"
#include "command/Response.hxx"
#include "config/Data.hxx"
#include "io/StdioOutputStream.hxx"
#include "util/Domain.hxx"

#include <stdio.h>
#include <stdlib.h>

static constexpr Domain main_domain("main");

static void
MainOrThrow(int argc, char *argv[])
{
	CommandLineOptions options;
	ConfigData raw_config;

	ParseCommandLine(argc, argv, options, raw_config);

	log_init(raw_config, options.verbose);

	command_init();

	const auto context = MakeCommandContext(raw_config,
						options.date_format,
						options.start,
						options.count);

	StdioOutputStream os(stdout);
	Response r(os);

	command_process(context, options.args, r);
}

int
main(int argc, char *argv[]) noexcept
try {
	MainOrThrow(argc, argv);
	return EXIT_SUCCESS;
} catch (const CommandError &) {
	LogError(std::current_exception());
	Log(LogLevel::NOTICE, main_domain,
	    "Try \"--help\" for a list of commands");
	return EXIT_FAILURE;
} catch (...) {
	LogError(std::current_exception());
	return EXIT_FAILURE;
}
