// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string_view>

/**
 * The "SameSite" attribute of a "Set-Cookie" response header.
 * DEFAULT means the attribute is omitted.
 */
enum class CookieSameSite : uint8_t {
	DEFAULT,
	STRICT,
	LAX,
	NONE,
};

/**
 * Throws on error.
 */
CookieSameSite
ParseCookieSameSite(std::string_view s);

/**
 * @return the attribute value to be used in "Set-Cookie" or an
 * empty string for CookieSameSite::DEFAULT
 */
[[gnu::const]]
std::string_view
ToString(CookieSameSite same_site) noexcept;
