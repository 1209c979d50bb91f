// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * HTTP character classes according to RFC 9110 5.6.2 and RFC 6265
 * 4.1.1.
 */

#pragma once

#include <algorithm>
#include <string_view>

constexpr bool
char_is_http_char(char ch) noexcept
{
	return (ch & 0x80) == 0;
}

constexpr bool
char_is_http_ctl(char ch) noexcept
{
	return (((unsigned char)ch) <= 0x1f) || ch == 0x7f;
}

constexpr bool
char_is_http_sp(char ch) noexcept
{
	return ch == ' ';
}

constexpr bool
char_is_http_ht(char ch) noexcept
{
	return ch == '\t';
}

constexpr bool
char_is_http_separator(char ch) noexcept
{
	return ch == '(' || ch == ')' || ch == '<' || ch == '>' ||
		ch == '@' || ch == ',' || ch == ';' || ch == ':' ||
		ch == '\\' || ch == '"' || ch == '/' ||
		ch == '[' || ch == ']' ||
		ch == '?' || ch == '=' || ch == '{' || ch == '}' ||
		char_is_http_sp(ch) || char_is_http_ht(ch);
}

constexpr bool
char_is_http_token(char ch) noexcept
{
	return char_is_http_char(ch) && !char_is_http_ctl(ch) &&
		!char_is_http_separator(ch);
}

/**
 * Is this a "cookie-octet" (RFC 6265 4.1.1)?  That excludes
 * whitespace, double quote, comma, semicolon, backslash and control
 * characters.
 */
constexpr bool
char_is_cookie_octet(char ch) noexcept
{
	return ch == 0x21 || (ch >= 0x23 && ch <= 0x2b) ||
		(ch >= 0x2d && ch <= 0x3a) ||
		(ch >= 0x3c && ch <= 0x5b) ||
		(ch >= 0x5d && ch <= 0x7e);
}

/**
 * Is the whole string a non-empty HTTP token?  Header names and
 * cookie names must be tokens.
 */
constexpr bool
http_is_token(std::string_view s) noexcept
{
	return !s.empty() && std::all_of(s.begin(), s.end(), char_is_http_token);
}

/**
 * May this string be used as a cookie value without quoting?
 */
constexpr bool
cookie_is_value(std::string_view s) noexcept
{
	return std::all_of(s.begin(), s.end(), char_is_cookie_octet);
}
