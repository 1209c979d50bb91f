// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Random.hxx"
#include "lib/sodium/Init.hxx"

#include <sodium/randombytes.h>

SodiumCsrfRandom::SodiumCsrfRandom()
{
	SodiumInit();
}

void
SodiumCsrfRandom::Fill(std::span<std::byte> dest)
{
	randombytes_buf(dest.data(), dest.size());
}

CsrfRandom &
GetDefaultCsrfRandom()
{
	static SodiumCsrfRandom instance;
	return instance;
}
