// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

/**
 * @return the value of the given hex digit or -1 if the character
 * is not a hex digit
 */
constexpr int
ParseHexDigit(char ch) noexcept
{
	if (ch >= '0' && ch <= '9')
		return ch - '0';
	else if (ch >= 'a' && ch <= 'f')
		return ch - 'a' + 0xa;
	else if (ch >= 'A' && ch <= 'F')
		return ch - 'A' + 0xa;
	else
		return -1;
}

/**
 * Parse a fixed-length hex string (two digits per output byte).
 *
 * @return true on success, false if the length does not match or
 * a character is not a hex digit
 */
bool
ParseHexFixed(std::string_view src, std::span<std::byte> dest) noexcept;
