// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Token.hxx"
#include "Random.hxx"

#include <algorithm>

using std::size_t;

CsrfRawToken
GenerateCsrfToken(CsrfRandom &random)
{
	CsrfRawToken token;
	random.Fill(token);
	return token;
}

CsrfMaskedToken
MaskCsrfToken(CsrfRandom &random, const CsrfRawToken &token)
{
	CsrfMaskedToken result;
	const std::span<std::byte> pad{result.data(), token.size()};
	random.Fill(pad);

	for (size_t i = 0; i < token.size(); ++i)
		result[token.size() + i] = pad[i] ^ token[i];

	return result;
}

std::optional<CsrfRawToken>
UnmaskCsrfToken(std::span<const std::byte> masked) noexcept
{
	CsrfRawToken token;
	if (masked.size() != 2 * token.size())
		return std::nullopt;

	const auto pad = masked.first(token.size());
	const auto xored = masked.subspan(token.size());

	for (size_t i = 0; i < token.size(); ++i)
		token[i] = pad[i] ^ xored[i];

	return token;
}

bool
CsrfConstantTimeEquals(std::span<const std::byte> a,
		       std::span<const std::byte> b) noexcept
{
	/* a length mismatch does not return early; the loop always
	   covers the longer input */
	const size_t n = std::max(a.size(), b.size());
	unsigned diff = a.size() != b.size();

	for (size_t i = 0; i < n; ++i) {
		const std::byte x = i < a.size() ? a[i] : std::byte{};
		const std::byte y = i < b.size() ? b[i] : std::byte{};
		diff |= std::to_integer<unsigned>(x ^ y);
	}

	return diff == 0;
}
