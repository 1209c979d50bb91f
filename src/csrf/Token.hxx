// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "csrf-protect/Protocol.hxx"

#include <array>
#include <cstddef>
#include <optional>
#include <span>

class CsrfRandom;

/**
 * The secret per-client token.  It is never transmitted unmasked.
 */
using CsrfRawToken = std::array<std::byte, CsrfProtect::TOKEN_LENGTH>;

/**
 * A #CsrfRawToken masked with a one-time pad: the pad followed by
 * the token XORed with the pad.  Each response carries a freshly
 * masked token, which defeats compression side channels (BREACH).
 */
using CsrfMaskedToken = std::array<std::byte, CsrfProtect::MASKED_TOKEN_LENGTH>;

/**
 * Generate a new random token.
 *
 * Throws if the random source fails.
 */
CsrfRawToken
GenerateCsrfToken(CsrfRandom &random);

/**
 * Mask the token with a new one-time pad.
 *
 * Throws if the random source fails.
 */
CsrfMaskedToken
MaskCsrfToken(CsrfRandom &random, const CsrfRawToken &token);

/**
 * Undo MaskCsrfToken().
 *
 * @return the raw token or std::nullopt if the input does not have
 * the length of a masked token
 */
[[gnu::pure]]
std::optional<CsrfRawToken>
UnmaskCsrfToken(std::span<const std::byte> masked) noexcept;

/**
 * Compare two byte strings in constant time, i.e. the duration
 * depends only on the lengths, not on the contents.  Strings of
 * different lengths are never equal.
 */
[[gnu::pure]]
bool
CsrfConstantTimeEquals(std::span<const std::byte> a,
		       std::span<const std::byte> b) noexcept;
