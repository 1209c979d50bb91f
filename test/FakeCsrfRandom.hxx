// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "csrf/Random.hxx"

#include <cstdint>
#include <stdexcept>

/**
 * A predictable #CsrfRandom (xorshift) for unit tests.
 */
class FakeCsrfRandom final : public CsrfRandom {
	uint_least64_t state;

public:
	explicit FakeCsrfRandom(uint_least64_t seed=0x2545f4914f6cdd1d) noexcept
		:state(seed) {}

	void Fill(std::span<std::byte> dest) override {
		for (auto &i : dest) {
			state ^= state << 13;
			state ^= state >> 7;
			state ^= state << 17;
			i = static_cast<std::byte>(state);
		}
	}
};

/**
 * A #CsrfRandom which always fails.
 */
class FailingCsrfRandom final : public CsrfRandom {
public:
	void Fill(std::span<std::byte>) override {
		throw std::runtime_error{"No entropy"};
	}
};
