// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TokenCodec.hxx"
#include "lib/sodium/Base64.hxx"

std::string
EncodeCsrfToken(const CsrfMaskedToken &token) noexcept
{
	return UrlSafeBase64(token);
}

std::optional<CsrfMaskedToken>
DecodeCsrfToken(std::string_view s) noexcept
{
	if (s.size() != CsrfProtect::ENCODED_TOKEN_LENGTH)
		return std::nullopt;

	CsrfMaskedToken token;
	if (!DecodeUrlSafeBase64(s, token))
		return std::nullopt;

	return token;
}
