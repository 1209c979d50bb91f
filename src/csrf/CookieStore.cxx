// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CookieStore.hxx"
#include "TokenCodec.hxx"
#include "http/CommonHeaders.hxx"
#include "http/CookieExtract.hxx"
#include "http/IncomingRequest.hxx"
#include "http/SetCookie.hxx"
#include "lib/sodium/Base64.hxx"
#include "lib/sodium/GenericHash.hxx"
#include "lib/sodium/Init.hxx"
#include "util/StringSplit.hxx"

#include <cstdint>

using std::string_view_literals::operator""sv;

static constexpr std::size_t TIMESTAMP_SIZE = 8;
static constexpr std::size_t MAC_SIZE = 32;

/**
 * The decoded part after the dot: timestamp (big-endian seconds
 * since the epoch) followed by the MAC.
 */
using CookieSignature = std::array<std::byte, TIMESTAMP_SIZE + MAC_SIZE>;

static void
ExportTimestamp(std::span<std::byte, TIMESTAMP_SIZE> dest,
		std::int64_t value) noexcept
{
	auto u = static_cast<std::uint64_t>(value);
	for (std::size_t i = TIMESTAMP_SIZE; i-- > 0;) {
		dest[i] = static_cast<std::byte>(u & 0xff);
		u >>= 8;
	}
}

[[gnu::pure]]
static std::int64_t
ImportTimestamp(std::span<const std::byte, TIMESTAMP_SIZE> src) noexcept
{
	std::uint64_t u = 0;
	for (const auto b : src)
		u = (u << 8) | std::to_integer<std::uint64_t>(b);
	return static_cast<std::int64_t>(u);
}

static void
Sign(std::span<std::byte, MAC_SIZE> mac, const CsrfAuthKey &key,
     std::string_view cookie_name,
     std::span<const std::byte, TIMESTAMP_SIZE> timestamp,
     const CsrfMaskedToken &token) noexcept
{
	/* the cookie name is part of the MAC so a value cannot be
	   moved to another cookie */
	GenericHashState state{MAC_SIZE, key};
	state.Update(cookie_name);
	state.Update("\0"sv);
	state.Update(timestamp);
	state.Update(token);
	state.Final(mac);
}

static std::int64_t
ToSeconds(std::chrono::system_clock::time_point t) noexcept
{
	return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

CookieCsrfTokenStore::CookieCsrfTokenStore(const CsrfConfig &_config,
					   const CsrfAuthKey &_key,
					   CsrfRandom &_random,
					   Clock _clock)
	:config(_config), key(_key), random(_random),
	 clock(std::move(_clock))
{
	SodiumInit();
}

std::optional<CsrfRawToken>
CookieCsrfTokenStore::Load(const IncomingHttpRequest &request) const noexcept
{
	const auto value = ExtractCookie(request.headers, config.cookie_name);
	if (value.data() == nullptr)
		return std::nullopt;

	const auto [encoded_token, encoded_signature] = Split(value, '.');
	if (encoded_signature.data() == nullptr) {
		logger(4, "Cookie without signature");
		return std::nullopt;
	}

	const auto token = DecodeCsrfToken(encoded_token);
	if (!token) {
		logger(4, "Malformed token in cookie");
		return std::nullopt;
	}

	CookieSignature signature;
	if (!DecodeUrlSafeBase64(encoded_signature, signature)) {
		logger(4, "Malformed cookie signature");
		return std::nullopt;
	}

	const auto timestamp = std::span{signature}.first<TIMESTAMP_SIZE>();
	const auto mac = std::span{signature}.last<MAC_SIZE>();

	std::array<std::byte, MAC_SIZE> expected_mac;
	Sign(expected_mac, key, config.cookie_name, timestamp, *token);
	if (!CsrfConstantTimeEquals(mac, expected_mac)) {
		logger(4, "Bad cookie signature");
		return std::nullopt;
	}

	const std::int64_t issued = ImportTimestamp(timestamp);
	const std::int64_t now = ToSeconds(clock());

	if (issued > now + max_clock_skew.count()) {
		logger(4, "Cookie was issued in the future");
		return std::nullopt;
	}

	if (config.max_age > std::chrono::seconds::zero() &&
	    now - issued > config.max_age.count()) {
		logger(4, "Cookie has expired");
		return std::nullopt;
	}

	return UnmaskCsrfToken(*token);
}

void
CookieCsrfTokenStore::Save(IncomingHttpRequest &request,
			   const CsrfRawToken &raw_token)
{
	const auto token = MaskCsrfToken(random, raw_token);

	CookieSignature signature;
	const auto timestamp = std::span{signature}.first<TIMESTAMP_SIZE>();
	ExportTimestamp(timestamp, ToSeconds(clock()));
	Sign(std::span{signature}.last<MAC_SIZE>(),
	     key, config.cookie_name, timestamp, token);

	std::string value = EncodeCsrfToken(token);
	value.push_back('.');
	value += UrlSafeBase64(signature);

	request.response_headers.Write(set_cookie_header,
				       FormatSetCookie(config.cookie_name, value,
						       config.GetCookieAttributes()));
}

CsrfRawToken
CookieCsrfTokenStore::New()
{
	return GenerateCsrfToken(random);
}
