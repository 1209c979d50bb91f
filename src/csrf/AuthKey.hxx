// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string_view>

class CsrfRandom;

/**
 * The secret key which authenticates the CSRF cookie.  All
 * instances of a cluster must share the same key.
 */
struct CsrfAuthKey {
	static constexpr std::size_t SIZE = 32;

	std::array<std::byte, SIZE> data;

	/**
	 * Throws if the random source fails.
	 */
	static CsrfAuthKey Generate(CsrfRandom &random);

	/**
	 * Parse #SIZE bytes encoded as hex digits.
	 *
	 * Throws std::invalid_argument on error.
	 */
	static CsrfAuthKey Parse(std::string_view hex);

	operator std::span<const std::byte>() const noexcept {
		return data;
	}
};
