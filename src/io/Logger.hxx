// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

/**
 * Messages with a level greater than this are suppressed.  Level 1
 * is for errors, level 2 for warnings and important messages, level
 * 3 for informational messages and level 4 for debugging.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

/**
 * A logger which prefixes each message with a domain string and
 * writes it to stderr.
 */
class Logger {
	std::string domain;

public:
	Logger() = default;

	explicit Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	[[gnu::pure]]
	static bool WouldLog(unsigned level) noexcept {
		return level <= GetLogLevel();
	}

	/**
	 * Concatenate all parameters and log the result.  Strings,
	 * numbers and exceptions are accepted.
	 */
	template<typename... Params>
	void operator()(unsigned level, Params &&... params) const noexcept {
		if (!WouldLog(level))
			return;

		fmt::memory_buffer buffer;
		(Append(buffer, std::forward<Params>(params)), ...);
		Write({buffer.data(), buffer.size()});
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		if (!WouldLog(level))
			return;

		fmt::memory_buffer buffer;
		fmt::format_to(std::back_inserter(buffer), format_str,
			       std::forward<Args>(args)...);
		Write({buffer.data(), buffer.size()});
	}

private:
	void Write(std::string_view msg) const noexcept;

	static void Append(fmt::memory_buffer &buffer,
			   std::string_view s) noexcept {
		buffer.append(s);
	}

	static void Append(fmt::memory_buffer &buffer,
			   std::exception_ptr ep) noexcept;

	static void Append(fmt::memory_buffer &buffer,
			   const std::exception &e) noexcept;

	template<typename T>
	requires std::is_arithmetic_v<std::remove_cvref_t<T>>
	static void Append(fmt::memory_buffer &buffer, T value) noexcept {
		fmt::format_to(std::back_inserter(buffer), "{}", value);
	}
};
