// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The mayacal Project

#pragma once

#include "io/OutputStream.hxx"
#include "util/SpanCast.hxx"

#include <algorithm>
#include <cstddef>
#include <string>

/**
 * An #OutputStream which collects command output in memory.
 */
class CaptureOutputStream final : public OutputStream {
	std::string value;

public:
	const std::string &GetValue() const noexcept {
		return value;
	}

	std::size_t CountLines() const noexcept {
		return std::count(value.begin(), value.end(), '\n');
	}

	void Write(std::span<const std::byte> src) override {
		value.append(ToStringView(src));
	}
};
