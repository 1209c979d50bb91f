// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <atomic>

#include <stdio.h>

static std::atomic_uint log_level{1};

void
SetLogLevel(unsigned level) noexcept
{
	log_level.store(level, std::memory_order_relaxed);
}

unsigned
GetLogLevel() noexcept
{
	return log_level.load(std::memory_order_relaxed);
}

void
Logger::Append(fmt::memory_buffer &buffer, std::exception_ptr ep) noexcept
{
	buffer.append(std::string_view{GetFullMessage(ep)});
}

void
Logger::Append(fmt::memory_buffer &buffer, const std::exception &e) noexcept
{
	buffer.append(std::string_view{GetFullMessage(e)});
}

void
Logger::Write(std::string_view msg) const noexcept
{
	fmt::memory_buffer line;

	if (!domain.empty()) {
		line.push_back('[');
		line.append(std::string_view{domain});
		line.append(std::string_view{"] "});
	}

	line.append(msg);
	line.push_back('\n');

	/* a single fwrite() call so concurrent messages do not get
	   interleaved */
	fwrite(line.data(), 1, line.size(), stderr);
}
