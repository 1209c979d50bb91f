// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sodium/crypto_generichash.h>

#include <cstddef>
#include <span>
#include <string_view>

/**
 * OO wrapper for crypto_generichash_state (keyed BLAKE2b).
 */
class GenericHashState {
	crypto_generichash_state state;

public:
	explicit GenericHashState(std::size_t outlen,
				  std::span<const std::byte> key={}) noexcept {
		crypto_generichash_init(&state,
					reinterpret_cast<const unsigned char *>(key.data()),
					key.size(), outlen);
	}

	void Update(std::span<const std::byte> p) noexcept {
		crypto_generichash_update(&state,
					  reinterpret_cast<const unsigned char *>(p.data()),
					  p.size());
	}

	void Update(std::string_view s) noexcept {
		Update(std::as_bytes(std::span{s}));
	}

	void Final(std::span<std::byte> out) noexcept {
		crypto_generichash_final(&state,
					 reinterpret_cast<unsigned char *>(out.data()),
					 out.size());
	}
};
