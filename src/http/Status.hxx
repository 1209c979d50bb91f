// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string_view>

/**
 * The HTTP status codes this library generates or needs to know
 * about.
 */
enum class HttpStatus : uint_least16_t {
	OK = 200,
	CREATED = 201,
	NO_CONTENT = 204,

	MOVED_PERMANENTLY = 301,
	FOUND = 302,
	SEE_OTHER = 303,

	BAD_REQUEST = 400,
	UNAUTHORIZED = 401,
	FORBIDDEN = 403,
	NOT_FOUND = 404,
	METHOD_NOT_ALLOWED = 405,

	INTERNAL_SERVER_ERROR = 500,
	BAD_GATEWAY = 502,
	SERVICE_UNAVAILABLE = 503,
};

/**
 * @return the reason phrase (e.g. "Forbidden") or an empty string
 * for an unknown status
 */
[[gnu::const]]
std::string_view
http_status_reason(HttpStatus status) noexcept;
