// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Token.hxx"

#include <optional>
#include <string>
#include <string_view>

/**
 * Convert a masked token to its text representation (URL-safe
 * base64 without padding), which is safe in headers, cookies and
 * form fields.
 */
std::string
EncodeCsrfToken(const CsrfMaskedToken &token) noexcept;

/**
 * Parse the text representation of a masked token.
 *
 * @return the masked token or std::nullopt if the string is not
 * valid base64 or does not decode to exactly
 * #CsrfProtect::MASKED_TOKEN_LENGTH bytes
 */
[[gnu::pure]]
std::optional<CsrfMaskedToken>
DecodeCsrfToken(std::string_view s) noexcept;
