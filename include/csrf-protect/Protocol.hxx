// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Constants shared by csrf-protect and its clients.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace CsrfProtect {

/**
 * The length of an unmasked token in bytes.
 */
static constexpr std::size_t TOKEN_LENGTH = 32;

/**
 * The length of a masked token in bytes: the one-time pad followed
 * by the token XORed with it.
 */
static constexpr std::size_t MASKED_TOKEN_LENGTH = 2 * TOKEN_LENGTH;

/**
 * The length of a masked token in URL-safe base64 without padding.
 */
static constexpr std::size_t ENCODED_TOKEN_LENGTH =
	(MASKED_TOKEN_LENGTH * 4 + 2) / 3;

static constexpr std::string_view DEFAULT_COOKIE_NAME = "_csrf";
static constexpr std::string_view DEFAULT_REQUEST_HEADER = "X-CSRF-Token";
static constexpr std::string_view DEFAULT_FIELD_NAME = "csrfToken";

/**
 * Twelve hours.
 */
static constexpr std::chrono::seconds DEFAULT_MAX_AGE{12 * 3600};

/**
 * The reason why a request was rejected.
 */
enum class Failure : uint8_t {
	/**
	 * The request was accepted (or not checked at all).
	 */
	NONE,

	/**
	 * Neither the request header nor the form field contained
	 * a token.
	 */
	NO_TOKEN,

	/**
	 * The submitted token could not be decoded.
	 */
	MALFORMED_TOKEN,

	/**
	 * The submitted token does not match the token stored in
	 * the cookie.
	 */
	TOKEN_MISMATCH,
};

} // namespace CsrfProtect
