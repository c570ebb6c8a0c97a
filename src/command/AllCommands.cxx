// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "AllCommands.hxx"
#include "CalendarCommands.hxx"
#include "CommandError.hxx"
#include "Request.hxx"
#include "Response.hxx"
#include "lib/fmt/ToBuffer.hxx"

#include <cassert>
#include <string.h>
#include <iterator>

struct command {
	const char *cmd;
	int min;
	int max;
	void (*handler)(const CommandContext &context, Request request, Response &response);
	const char *usage;
};

static void
handle_commands(const CommandContext &context, Request request, Response &response);

/**
 * The command registry.
 *
 * This array must be sorted!
 */
static constexpr struct command commands[] = {
	{ "add", 4, 4, handle_add, "SYSTEM NUMBER NAME DAYS" },
	{ "calendar", 1, 1, handle_calendar, "SYSTEM" },
	{ "commands", 0, 0, handle_commands, "" },
	{ "convert", 0, 1, handle_convert, "[DATE]" },
	{ "diff", 5, 5, handle_diff, "SYSTEM NUMBER1 NAME1 NUMBER2 NAME2" },
	{ "haab", 0, 1, handle_haab, "[DATE]" },
	{ "info", 3, 3, handle_info, "SYSTEM NUMBER NAME" },
	{ "last", 3, 4, handle_last, "SYSTEM NUMBER NAME [COUNT]" },
	{ "next", 3, 4, handle_next, "SYSTEM NUMBER NAME [COUNT]" },
	{ "parse", 2, 2, handle_parse, "SYSTEM STRING" },
	{ "tzolkin", 0, 1, handle_tzolkin, "[DATE]" },
};

static constexpr unsigned num_commands = std::size(commands);

void
command_print_usage(Response &r)
{
	for (const auto &i : commands)
		r.Fmt("  {} {}\n", i.cmd, i.usage);
}

/* don't be fooled, this is the command handler for "commands" command */
static void
handle_commands([[maybe_unused]] const CommandContext &context,
		[[maybe_unused]] Request request, Response &r)
{
	for (const auto &i : commands)
		r.Fmt("{}\n", i.cmd);
}

void
command_init() noexcept
{
#ifndef NDEBUG
	/* ensure that the command list is sorted */
	for (unsigned i = 0; i < num_commands - 1; ++i)
		assert(strcmp(commands[i].cmd, commands[i + 1].cmd) < 0);
#endif
}

[[gnu::pure]]
static const struct command *
command_lookup(const char *name) noexcept
{
	unsigned a = 0, b = num_commands, i;

	/* binary search */
	do {
		i = (a + b) / 2;

		const auto cmp = strcmp(name, commands[i].cmd);
		if (cmp == 0)
			return &commands[i];
		else if (cmp < 0)
			b = i;
		else if (cmp > 0)
			a = i + 1;
	} while (a < b);

	return nullptr;
}

static void
command_check_request(const struct command *cmd, Request args)
{
	const unsigned min = cmd->min;
	const unsigned max = cmd->max;

	if (min == max && max != args.size())
		throw CommandError(CommandErrorCode::ARG,
				   FmtBuffer<256>("wrong number of arguments for \"{}\"",
						  cmd->cmd).c_str());
	else if (args.size() < min)
		throw CommandError(CommandErrorCode::ARG,
				   FmtBuffer<256>("too few arguments for \"{}\"",
						  cmd->cmd).c_str());
	else if (args.size() > max)
		throw CommandError(CommandErrorCode::ARG,
				   FmtBuffer<256>("too many arguments for \"{}\"",
						  cmd->cmd).c_str());
}

void
command_process(const CommandContext &context,
		std::span<const char *const> argv, Response &r)
{
	if (argv.empty())
		throw CommandError(CommandErrorCode::UNKNOWN, "No command given");

	const char *cmd_name = argv.front();
	const Request args{argv.subspan(1)};

	const struct command *cmd = command_lookup(cmd_name);
	if (cmd == nullptr)
		throw CommandError(CommandErrorCode::UNKNOWN,
				   FmtBuffer<256>("unknown command \"{}\"",
						  cmd_name).c_str());

	command_check_request(cmd, args);

	cmd->handler(context, args, r);
}
