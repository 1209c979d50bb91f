// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "io/Logger.hxx"
#include "util/Exception.hxx"
#include "util/ScopeExit.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(Logger, Level)
{
	const unsigned old_level = GetLogLevel();
	AtScopeExit(old_level) { SetLogLevel(old_level); };

	SetLogLevel(2);
	EXPECT_TRUE(Logger::WouldLog(1));
	EXPECT_TRUE(Logger::WouldLog(2));
	EXPECT_FALSE(Logger::WouldLog(3));

	SetLogLevel(4);
	EXPECT_TRUE(Logger::WouldLog(4));

	const Logger logger{"test"};
	logger(4, "a message with a number: ", 42);
	logger.Fmt(4, "formatted {}", "message");
	logger(4, std::runtime_error{"an exception"});
}

TEST(Logger, FullMessage)
{
	try {
		try {
			throw std::runtime_error{"inner"};
		} catch (...) {
			std::throw_with_nested(std::runtime_error{"outer"});
		}
	} catch (const std::exception &e) {
		EXPECT_EQ(GetFullMessage(e), "outer; inner");
		EXPECT_EQ(GetFullMessage(std::current_exception()), "outer; inner");
	}

	EXPECT_EQ(GetFullMessage(std::exception_ptr{}), "Unknown exception");
}
