// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "CookieSameSite.hxx"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

/**
 * Attributes of a "Set-Cookie" response header (RFC 6265 4.1).
 */
struct SetCookieAttributes {
	/**
	 * The "Path" attribute; empty means the attribute is omitted
	 * and the client uses the path of the request.
	 */
	std::string_view path;

	/**
	 * The "Domain" attribute; empty means the attribute is omitted
	 * and the cookie is host-only.
	 */
	std::string_view domain;

	/**
	 * The "Max-Age" attribute; std::nullopt means the attribute
	 * is omitted (session cookie).  Negative values are clamped
	 * to zero, which instructs the client to delete the cookie.
	 */
	std::optional<std::chrono::seconds> max_age;

	bool secure = false;
	bool http_only = false;

	CookieSameSite same_site = CookieSameSite::DEFAULT;
};

/**
 * Format the value of a "Set-Cookie" response header.  The caller
 * is responsible for passing a valid cookie name (an HTTP token) and
 * a value consisting only of cookie octets.
 */
std::string
FormatSetCookie(std::string_view name, std::string_view value,
		const SetCookieAttributes &attributes) noexcept;
