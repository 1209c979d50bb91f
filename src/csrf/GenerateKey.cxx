// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Print a new random key for the "auth_key" setting.
 */

#include "AuthKey.hxx"
#include "Random.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <exception>
#include <iterator>

#include <stdlib.h>

int
main(int argc, char **) noexcept
try {
	if (argc != 1) {
		fmt::print(stderr, "Usage: csrf-protect-keygen\n");
		return EXIT_FAILURE;
	}

	const auto key = CsrfAuthKey::Generate(GetDefaultCsrfRandom());

	fmt::memory_buffer buffer;
	for (const auto b : key.data)
		fmt::format_to(std::back_inserter(buffer), "{:02x}",
			       std::to_integer<unsigned>(b));

	fmt::print("auth_key {}\n", std::string_view{buffer.data(), buffer.size()});
	return EXIT_SUCCESS;
} catch (...) {
	fmt::print(stderr, "{}\n", GetFullMessage(std::current_exception()));
	return EXIT_FAILURE;
}
