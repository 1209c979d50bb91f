// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>

/**
 * A source of cryptographically secure random bytes.
 */
class CsrfRandom {
public:
	virtual ~CsrfRandom() noexcept = default;

	/**
	 * Fill the buffer with random bytes.
	 *
	 * Throws on error.  Callers must not recover from this error
	 * by using predictable data.
	 */
	virtual void Fill(std::span<std::byte> dest) = 0;
};

/**
 * A #CsrfRandom implementation using libsodium's randombytes_buf().
 */
class SodiumCsrfRandom final : public CsrfRandom {
public:
	/**
	 * Throws if libsodium cannot be initialized.
	 */
	SodiumCsrfRandom();

	void Fill(std::span<std::byte> dest) override;
};

/**
 * Obtain the process-wide #SodiumCsrfRandom instance.
 *
 * Throws if libsodium cannot be initialized.
 */
CsrfRandom &
GetDefaultCsrfRandom();
