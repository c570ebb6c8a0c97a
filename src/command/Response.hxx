// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#pragma once

#include <fmt/core.h>

#include <string_view>

class OutputStream;

/**
 * The output of a command.  Everything is passed on to an
 * #OutputStream; the command line tool writes to stdout.
 */
class Response {
	OutputStream &os;

public:
	explicit Response(OutputStream &_os) noexcept
		:os(_os) {}

	Response(const Response &) = delete;
	Response &operator=(const Response &) = delete;

	/**
	 * Throws on I/O error.
	 */
	void Write(std::string_view s);

	void VFmt(fmt::string_view format_str, fmt::format_args args);

	template<typename S, typename... Args>
	void Fmt(const S &format_str, Args&&... args) {
		VFmt(format_str, fmt::make_format_args(args...));
	}
};
