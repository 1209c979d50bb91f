// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CookieExtract.hxx"
#include "CookieString.hxx"
#include "CommonHeaders.hxx"
#include "StringMap.hxx"
#include "Tokenizer.hxx"
#include "util/IterableSplitString.hxx"
#include "util/StringStrip.hxx"

std::string_view
ExtractCookieRaw(std::string_view cookie_header, std::string_view name) noexcept
{
	for (std::string_view i : IterableSplitString(cookie_header, ';')) {
		i = StripLeft(i);

		const auto current_name = http_next_token(i);
		if (current_name == name) {
			i = StripLeft(i);
			if (i.empty())
				return i;

			if (i.front() != '=')
				return {};

			i = StripLeft(i.substr(1));
			return cookie_next_rfc_ignorant_value(i);
		}
	}

	return {};
}

std::string_view
ExtractCookie(const StringMap &request_headers, std::string_view name) noexcept
{
	const auto [begin, end] = request_headers.EqualRange(cookie_header);
	for (auto i = begin; i != end; ++i) {
		const auto value = ExtractCookieRaw(i->second, name);
		if (value.data() != nullptr)
			return value;
	}

	return {};
}
