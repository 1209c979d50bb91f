// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Initialize libsodium.  This may be called more than once.
 *
 * Throws std::runtime_error on error.
 */
void
SodiumInit();
