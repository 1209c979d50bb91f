// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HTML.hxx"

using std::string_view_literals::operator""sv;

[[gnu::const]]
static std::string_view
html_escape_char(char ch) noexcept
{
	switch (ch) {
	case '&':
		return "&amp;"sv;

	case '"':
		return "&quot;"sv;

	case '\'':
		return "&apos;"sv;

	case '<':
		return "&lt;"sv;

	case '>':
		return "&gt;"sv;

	default:
		return {};
	}
}

static std::size_t
html_escape_size(std::string_view p) noexcept
{
	std::size_t size = 0;
	for (const char ch : p) {
		const auto escaped = html_escape_char(ch);
		size += escaped.empty() ? 1 : escaped.size();
	}

	return size;
}

std::string
HtmlEscape(std::string_view src) noexcept
{
	std::string dest;
	dest.reserve(html_escape_size(src));

	for (const char ch : src) {
		if (const auto escaped = html_escape_char(ch); !escaped.empty())
			dest.append(escaped);
		else
			dest.push_back(ch);
	}

	return dest;
}
