// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

class StringMap;

/**
 * Extract a cookie with a specific name from the "Cookie" request
 * header value.
 *
 * @param cookie_header the "Cookie" request header
 * @param name the cookie name to look for
 *
 * @return the cookie value (without quotes) or a default-initialized
 * std::string_view if no such cookie was found
 */
[[gnu::pure]]
std::string_view
ExtractCookieRaw(std::string_view cookie_header, std::string_view name) noexcept;

/**
 * Like ExtractCookieRaw(), but look in all "Cookie" headers of the
 * given request header map (HTTP/2 clients may split the cookie
 * list into several headers).  The first match wins.
 */
[[gnu::pure]]
std::string_view
ExtractCookie(const StringMap &request_headers, std::string_view name) noexcept;
