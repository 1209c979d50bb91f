// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AuthKey.hxx"
#include "Random.hxx"
#include "util/HexParse.hxx"

#include <stdexcept>

CsrfAuthKey
CsrfAuthKey::Generate(CsrfRandom &random)
{
	CsrfAuthKey key;
	random.Fill(key.data);
	return key;
}

CsrfAuthKey
CsrfAuthKey::Parse(std::string_view hex)
{
	CsrfAuthKey key;
	if (!ParseHexFixed(hex, key.data))
		throw std::invalid_argument{"Malformed CSRF key; 64 hex digits expected"};
	return key;
}
