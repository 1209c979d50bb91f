// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <initializer_list>
#include <string_view>

enum class HttpMethod : uint_least8_t {
	/**
	 * Not a valid method; returned by ParseHttpMethod() for
	 * unknown method names.
	 */
	UNKNOWN,

	HEAD,
	GET,
	POST,
	PUT,
	DELETE,
	OPTIONS,
	TRACE,
	PATCH,
	CONNECT,

	/* WebDAV methods (RFC 4918) */
	PROPFIND,
	PROPPATCH,
	MKCOL,
	COPY,
	MOVE,
	LOCK,
	UNLOCK,
};

/**
 * Is this a "safe" method according to RFC 9110 9.2.1, i.e. it is
 * not expected to modify state on the server?
 */
constexpr bool
IsSafeMethod(HttpMethod method) noexcept
{
	return method == HttpMethod::GET ||
		method == HttpMethod::HEAD ||
		method == HttpMethod::OPTIONS ||
		method == HttpMethod::TRACE;
}

/**
 * Parse an upper-case request method name.
 *
 * @return the method or HttpMethod::UNKNOWN if the name is not known
 */
[[gnu::pure]]
HttpMethod
ParseHttpMethod(std::string_view s) noexcept;

/**
 * @return the upper-case method name or nullptr for
 * HttpMethod::UNKNOWN
 */
[[gnu::const]]
const char *
http_method_to_string(HttpMethod method) noexcept;

/**
 * A set of #HttpMethod values stored as a bit mask.
 */
class HttpMethodSet {
	uint_least32_t mask = 0;

	static constexpr uint_least32_t Bit(HttpMethod method) noexcept {
		return uint_least32_t(1) << static_cast<unsigned>(method);
	}

public:
	constexpr HttpMethodSet() noexcept = default;

	constexpr HttpMethodSet(std::initializer_list<HttpMethod> methods) noexcept {
		for (const auto i : methods)
			Add(i);
	}

	/**
	 * The methods for which IsSafeMethod() returns true.
	 */
	static constexpr HttpMethodSet Safe() noexcept {
		return {
			HttpMethod::GET, HttpMethod::HEAD,
			HttpMethod::OPTIONS, HttpMethod::TRACE,
		};
	}

	constexpr bool empty() const noexcept {
		return mask == 0;
	}

	constexpr void clear() noexcept {
		mask = 0;
	}

	constexpr void Add(HttpMethod method) noexcept {
		mask |= Bit(method);
	}

	constexpr void Remove(HttpMethod method) noexcept {
		mask &= ~Bit(method);
	}

	constexpr bool Contains(HttpMethod method) const noexcept {
		return (mask & Bit(method)) != 0;
	}

	constexpr bool operator==(const HttpMethodSet &) const noexcept = default;
};
