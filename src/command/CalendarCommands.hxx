// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#ifndef MAYACAL_CALENDAR_COMMANDS_HXX
#define MAYACAL_CALENDAR_COMMANDS_HXX

struct CommandContext;
class Request;
class Response;

void
handle_add(const CommandContext &context, Request request, Response &response);

void
handle_calendar(const CommandContext &context, Request request, Response &response);

void
handle_convert(const CommandContext &context, Request request, Response &response);

void
handle_diff(const CommandContext &context, Request request, Response &response);

void
handle_haab(const CommandContext &context, Request request, Response &response);

void
handle_info(const CommandContext &context, Request request, Response &response);

void
handle_last(const CommandContext &context, Request request, Response &response);

void
handle_next(const CommandContext &context, Request request, Response &response);

void
handle_parse(const CommandContext &context, Request request, Response &response);

void
handle_tzolkin(const CommandContext &context, Request request, Response &response);

#endif
