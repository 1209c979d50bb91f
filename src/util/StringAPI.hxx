// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "CharUtil.hxx"

#include <string_view>

#include <string.h>

[[gnu::pure]] [[gnu::nonnull]]
static inline bool
StringIsEqual(const char *a, const char *b) noexcept
{
	return strcmp(a, b) == 0;
}

/**
 * Compare two strings, ignoring the case of ASCII letters.
 */
[[gnu::pure]]
constexpr bool
StringIsEqualIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	if (a.size() != b.size())
		return false;

	for (std::size_t i = 0; i < a.size(); ++i)
		if (ToLowerASCII(a[i]) != ToLowerASCII(b[i]))
			return false;

	return true;
}
