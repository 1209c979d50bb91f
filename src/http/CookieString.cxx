// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CookieString.hxx"
#include "Chars.hxx"
#include "Tokenizer.hxx"
#include "util/StringSplit.hxx"
#include "util/StringStrip.hxx"

[[gnu::always_inline]]
static constexpr bool
char_is_rfc_ignorant_cookie_octet(char ch) noexcept
{
	return char_is_cookie_octet(ch) ||
		ch == ' ' || ch == ',';
}

static std::string_view
cookie_next_rfc_ignorant_value_raw(std::string_view &input) noexcept
{
	auto p = SplitWhile(input, char_is_rfc_ignorant_cookie_octet);
	input = p.second;

	/* trailing blanks belong to the separator, not to the value */
	return StripRight(p.first);
}

std::string_view
cookie_next_rfc_ignorant_value(std::string_view &input) noexcept
{
	if (input.starts_with('"'))
		return http_next_quoted_string_raw(input);
	else
		return cookie_next_rfc_ignorant_value_raw(input);
}
