// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CookieSameSite.hxx"

#include <stdexcept>

using std::string_view_literals::operator""sv;

CookieSameSite
ParseCookieSameSite(std::string_view s)
{
	if (s == "default"sv)
		return CookieSameSite::DEFAULT;
	else if (s == "strict"sv)
		return CookieSameSite::STRICT;
	else if (s == "lax"sv)
		return CookieSameSite::LAX;
	else if (s == "none"sv)
		return CookieSameSite::NONE;
	else
		throw std::invalid_argument{"Invalid Cookie/SameSite attribute value"};
}

std::string_view
ToString(CookieSameSite same_site) noexcept
{
	switch (same_site) {
	case CookieSameSite::DEFAULT:
		break;

	case CookieSameSite::STRICT:
		return "Strict"sv;

	case CookieSameSite::LAX:
		return "Lax"sv;

	case CookieSameSite::NONE:
		return "None"sv;
	}

	return {};
}
