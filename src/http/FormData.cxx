// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FormData.hxx"
#include "CommonHeaders.hxx"
#include "StringMap.hxx"
#include "util/HexParse.hxx"
#include "util/IterableSplitString.hxx"
#include "util/StringAPI.hxx"
#include "util/StringSplit.hxx"
#include "util/StringStrip.hxx"

using std::string_view_literals::operator""sv;

bool
IsFormUrlEncoded(const StringMap &request_headers) noexcept
{
	const auto content_type = request_headers.Get(content_type_header);
	if (content_type.data() == nullptr)
		return false;

	const auto mime_type = Strip(Split(content_type, ';').first);
	return StringIsEqualIgnoreCase(mime_type,
				       "application/x-www-form-urlencoded"sv);
}

std::optional<std::string>
UnescapeFormComponent(std::string_view src)
{
	std::string dest;
	dest.reserve(src.size());

	while (!src.empty()) {
		const char ch = src.front();
		src.remove_prefix(1);

		if (ch == '+') {
			dest.push_back(' ');
		} else if (ch == '%') {
			if (src.size() < 2)
				/* percent sign at the end of string */
				return std::nullopt;

			const int digit1 = ParseHexDigit(src[0]);
			const int digit2 = ParseHexDigit(src[1]);
			if (digit1 < 0 || digit2 < 0)
				/* invalid hex digits */
				return std::nullopt;

			const char decoded = (char)((digit1 << 4) | digit2);
			if (decoded == 0)
				/* no %00 hack allowed! */
				return std::nullopt;

			dest.push_back(decoded);
			src.remove_prefix(2);
		} else
			dest.push_back(ch);
	}

	return dest;
}

std::optional<std::string>
ExtractFormField(std::string_view body, std::string_view name)
{
	for (const std::string_view i : IterableSplitString(body, '&')) {
		const auto [raw_name, raw_value] = Split(i, '=');

		const auto decoded_name = UnescapeFormComponent(raw_name);
		if (!decoded_name || *decoded_name != name)
			continue;

		return UnescapeFormComponent(raw_value);
	}

	return std::nullopt;
}
