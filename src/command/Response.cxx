// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#include "Response.hxx"
#include "io/OutputStream.hxx"
#include "util/SpanCast.hxx"

#include <fmt/format.h>

#include <iterator>

void
Response::Write(std::string_view s)
{
	os.Write(AsBytes(s));
}

void
Response::VFmt(fmt::string_view format_str, fmt::format_args args)
{
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	Write({buffer.data(), buffer.size()});
}
