// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Base64.hxx"

#include <sodium/utils.h>

static constexpr int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;

std::string
UrlSafeBase64(std::span<const std::byte> src) noexcept
{
	std::string result;
	result.resize(sodium_base64_ENCODED_LEN(src.size(), variant));

	sodium_bin2base64(result.data(), result.size(),
			  reinterpret_cast<const unsigned char *>(src.data()),
			  src.size(), variant);

	/* strip the null terminator */
	result.pop_back();
	return result;
}

bool
DecodeUrlSafeBase64(std::string_view src, std::span<std::byte> dest) noexcept
{
	std::size_t length;
	if (sodium_base642bin(reinterpret_cast<unsigned char *>(dest.data()),
			      dest.size(),
			      src.data(), src.size(),
			      nullptr, &length, nullptr, variant) != 0)
		return false;

	return length == dest.size();
}
