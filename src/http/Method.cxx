// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Method.hxx"

#include <array>
#include <utility>

using std::string_view_literals::operator""sv;

static constexpr std::array http_method_names{
	std::pair{HttpMethod::HEAD, "HEAD"sv},
	std::pair{HttpMethod::GET, "GET"sv},
	std::pair{HttpMethod::POST, "POST"sv},
	std::pair{HttpMethod::PUT, "PUT"sv},
	std::pair{HttpMethod::DELETE, "DELETE"sv},
	std::pair{HttpMethod::OPTIONS, "OPTIONS"sv},
	std::pair{HttpMethod::TRACE, "TRACE"sv},
	std::pair{HttpMethod::PATCH, "PATCH"sv},
	std::pair{HttpMethod::CONNECT, "CONNECT"sv},
	std::pair{HttpMethod::PROPFIND, "PROPFIND"sv},
	std::pair{HttpMethod::PROPPATCH, "PROPPATCH"sv},
	std::pair{HttpMethod::MKCOL, "MKCOL"sv},
	std::pair{HttpMethod::COPY, "COPY"sv},
	std::pair{HttpMethod::MOVE, "MOVE"sv},
	std::pair{HttpMethod::LOCK, "LOCK"sv},
	std::pair{HttpMethod::UNLOCK, "UNLOCK"sv},
};

HttpMethod
ParseHttpMethod(std::string_view s) noexcept
{
	for (const auto &[method, name] : http_method_names)
		if (s == name)
			return method;

	return HttpMethod::UNKNOWN;
}

const char *
http_method_to_string(HttpMethod method) noexcept
{
	for (const auto &[m, name] : http_method_names)
		if (m == method)
			return name.data();

	return nullptr;
}
