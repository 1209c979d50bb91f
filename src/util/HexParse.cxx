// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HexParse.hxx"

bool
ParseHexFixed(std::string_view src, std::span<std::byte> dest) noexcept
{
	if (src.size() != dest.size() * 2)
		return false;

	for (auto &i : dest) {
		const int a = ParseHexDigit(src[0]);
		const int b = ParseHexDigit(src[1]);
		if (a < 0 || b < 0)
			return false;

		i = static_cast<std::byte>((a << 4) | b);
		src.remove_prefix(2);
	}

	return true;
}
