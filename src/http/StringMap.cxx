// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringMap.hxx"
#include "util/CharUtil.hxx"

#include <algorithm>
#include <iterator>

bool
StringMap::LessIgnoreCase::operator()(std::string_view a,
				      std::string_view b) const noexcept
{
	return std::lexicographical_compare(a.begin(), a.end(),
					    b.begin(), b.end(),
					    [](char x, char y){
						    return ToLowerASCII(x) < ToLowerASCII(y);
					    });
}

void
StringMap::Set(std::string_view key, std::string_view value)
{
	Remove(key);
	Add(key, value);
}

std::size_t
StringMap::Remove(std::string_view key) noexcept
{
	const auto [begin, end] = map.equal_range(key);
	const auto n = std::distance(begin, end);
	map.erase(begin, end);
	return n;
}

std::string_view
StringMap::Get(std::string_view key) const noexcept
{
	const auto i = map.find(key);
	if (i == map.end())
		return {};

	return i->second;
}
