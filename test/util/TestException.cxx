// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(ExceptionTest, RuntimeError)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(std::runtime_error("Foo"))), "Foo");
}

TEST(ExceptionTest, Unknown)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(42)), "Unknown exception");
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(42), "?"), "?");
}

TEST(ExceptionTest, Nested)
{
	try {
		throw std::invalid_argument("Bad day");
	} catch (...) {
		try {
			std::throw_with_nested(std::runtime_error("Error on line 3"));
		} catch (...) {
			EXPECT_EQ(GetFullMessage(std::current_exception()),
				  "Error on line 3; Bad day");
			EXPECT_EQ(GetFullMessage(std::current_exception(),
						 "", ": "),
				  "Error on line 3: Bad day");
		}
	}
}

TEST(ExceptionTest, FindNested)
{
	struct Foo {};
	struct Outer {};

	try {
		throw Foo{};
	} catch (...) {
		EXPECT_NE(FindNested<Foo>(std::current_exception()), nullptr);
		EXPECT_EQ(FindNested<Outer>(std::current_exception()), nullptr);

		try {
			std::throw_with_nested(Outer{});
		} catch (...) {
			EXPECT_NE(FindNested<Foo>(std::current_exception()),
				  nullptr);
			EXPECT_NE(FindNested<Outer>(std::current_exception()),
				  nullptr);
		}
	}

	try {
		throw std::runtime_error("X");
	} catch (...) {
		EXPECT_EQ(FindNested<Foo>(std::current_exception()), nullptr);
	}
}
