// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Status.hxx"

using std::string_view_literals::operator""sv;

std::string_view
http_status_reason(HttpStatus status) noexcept
{
	switch (status) {
	case HttpStatus::OK:
		return "OK"sv;

	case HttpStatus::CREATED:
		return "Created"sv;

	case HttpStatus::NO_CONTENT:
		return "No Content"sv;

	case HttpStatus::MOVED_PERMANENTLY:
		return "Moved Permanently"sv;

	case HttpStatus::FOUND:
		return "Found"sv;

	case HttpStatus::SEE_OTHER:
		return "See Other"sv;

	case HttpStatus::BAD_REQUEST:
		return "Bad Request"sv;

	case HttpStatus::UNAUTHORIZED:
		return "Unauthorized"sv;

	case HttpStatus::FORBIDDEN:
		return "Forbidden"sv;

	case HttpStatus::NOT_FOUND:
		return "Not Found"sv;

	case HttpStatus::METHOD_NOT_ALLOWED:
		return "Method Not Allowed"sv;

	case HttpStatus::INTERNAL_SERVER_ERROR:
		return "Internal Server Error"sv;

	case HttpStatus::BAD_GATEWAY:
		return "Bad Gateway"sv;

	case HttpStatus::SERVICE_UNAVAILABLE:
		return "Service Unavailable"sv;
	}

	return {};
}
