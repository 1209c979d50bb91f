// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

/**
 * Encode with the URL-safe base64 alphabet without padding.
 */
std::string
UrlSafeBase64(std::span<const std::byte> src) noexcept;

/**
 * Decode URL-safe base64 without padding.  The decoded data must
 * fill #dest exactly; anything else (including characters outside
 * the alphabet and trailing garbage) is an error.
 *
 * @return true on success
 */
bool
DecodeUrlSafeBase64(std::string_view src, std::span<std::byte> dest) noexcept;
