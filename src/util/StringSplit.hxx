// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>
#include <utility>

using StringViewPair = std::pair<std::string_view, std::string_view>;

/**
 * Split the string at the first occurrence of the given character.
 * If the character is not found, then the first value is the whole
 * string and the second value is a default-initialized
 * std::string_view (with data()==nullptr).
 */
constexpr StringViewPair
Split(std::string_view haystack, char ch) noexcept
{
	const auto i = haystack.find(ch);
	if (i == haystack.npos)
		return {haystack, {}};

	return {haystack.substr(0, i), haystack.substr(i + 1)};
}

/**
 * Split the string at the first character which does not match the
 * given predicate.
 */
constexpr StringViewPair
SplitWhile(std::string_view haystack, auto &&f) noexcept
{
	std::size_t i = 0;
	while (i < haystack.size() && f(haystack[i]))
		++i;

	return {haystack.substr(0, i), haystack.substr(i)};
}
