// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Store.hxx"
#include "Config.hxx"
#include "AuthKey.hxx"
#include "io/Logger.hxx"

#include <chrono>
#include <functional>

/**
 * A #CsrfTokenStore which keeps the token in a cookie on the
 * client.  The cookie value contains the masked token, the time it
 * was issued and a keyed BLAKE2b MAC over both, i.e. it cannot be
 * forged or modified without knowing the #CsrfAuthKey.
 */
class CookieCsrfTokenStore final : public CsrfTokenStore {
public:
	using Clock = std::function<std::chrono::system_clock::time_point()>;

private:
	/**
	 * Cookies issued in the future (according to our clock) are
	 * accepted with this tolerance.
	 */
	static constexpr std::chrono::seconds max_clock_skew{60};

	const Logger logger{"csrf_cookie"};

	const CsrfConfig config;
	const CsrfAuthKey key;

	CsrfRandom &random;

	const Clock clock;

public:
	/**
	 * Throws if libsodium cannot be initialized.
	 */
	CookieCsrfTokenStore(const CsrfConfig &_config, const CsrfAuthKey &_key,
			     CsrfRandom &_random,
			     Clock _clock=std::chrono::system_clock::now);

	/* virtual methods from CsrfTokenStore */
	std::optional<CsrfRawToken> Load(const IncomingHttpRequest &request) const noexcept override;
	void Save(IncomingHttpRequest &request,
		  const CsrfRawToken &token) override;
	CsrfRawToken New() override;
};
