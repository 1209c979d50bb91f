// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "StringMap.hxx"

/**
 * The headers of an HTTP response.  Unlike request headers, some
 * response headers (e.g. "Set-Cookie") may legally appear more than
 * once, which is why Write() always appends.
 */
class HttpHeaders {
	StringMap map;

public:
	HttpHeaders() = default;

	explicit HttpHeaders(StringMap &&_map) noexcept
		:map(std::move(_map)) {}

	HttpHeaders(HttpHeaders &&) = default;
	HttpHeaders &operator=(HttpHeaders &&) = default;

	StringMap &&ToMap() && noexcept {
		return std::move(map);
	}

	[[gnu::pure]]
	std::string_view Get(std::string_view name) const noexcept {
		return map.Get(name);
	}

	[[gnu::pure]]
	bool Contains(std::string_view name) const noexcept {
		return map.Contains(name);
	}

	void Write(std::string_view name, std::string_view value) {
		map.Add(name, value);
	}

	void Set(std::string_view name, std::string_view value) {
		map.Set(name, value);
	}

	/**
	 * Append all headers from #src.
	 */
	void Merge(HttpHeaders &&src) noexcept {
		map.Merge(std::move(src.map));
	}
};
