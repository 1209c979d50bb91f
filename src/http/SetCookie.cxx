// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SetCookie.hxx"
#include "Chars.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <cassert>
#include <iterator>

std::string
FormatSetCookie(std::string_view name, std::string_view value,
		const SetCookieAttributes &attributes) noexcept
{
	assert(http_is_token(name));
	assert(cookie_is_value(value));

	fmt::memory_buffer buffer;
	auto out = std::back_inserter(buffer);

	fmt::format_to(out, "{}={}", name, value);

	if (!attributes.path.empty())
		fmt::format_to(out, "; Path={}", attributes.path);

	if (!attributes.domain.empty())
		fmt::format_to(out, "; Domain={}", attributes.domain);

	if (attributes.max_age) {
		const auto max_age = std::max(attributes.max_age->count(),
					      std::chrono::seconds::rep{});
		fmt::format_to(out, "; Max-Age={}", max_age);
	}

	if (attributes.secure)
		fmt::format_to(out, "; Secure");

	if (attributes.http_only)
		fmt::format_to(out, "; HttpOnly");

	if (const auto same_site = ToString(attributes.same_site);
	    !same_site.empty())
		fmt::format_to(out, "; SameSite={}", same_site);

	return fmt::to_string(buffer);
}
