// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"
#include "http/Handler.hxx"
#include "io/Logger.hxx"

#include <memory>

class CsrfRandom;
class CsrfTokenStore;
struct CsrfAuthKey;

/**
 * An #HttpRequestHandler which protects another handler against
 * cross-site request forgery (double-submit cookie with masked
 * tokens).
 *
 * Each request gets a #CsrfRequestContext; the token cookie is
 * (re)issued with every response.  Requests with an unsafe method
 * must submit a masked copy of the token in a request header or a
 * form field; if they don't, the error handler is invoked instead
 * of the protected handler.
 */
class CsrfHandler final : public HttpRequestHandler {
	const Logger logger{"csrf"};

	HttpRequestHandler &next;

	const CsrfConfig config;

	CsrfRandom &random;

	std::unique_ptr<CsrfTokenStore> store;

public:
	/**
	 * Throws std::invalid_argument if the configuration is not
	 * usable.
	 */
	CsrfHandler(HttpRequestHandler &_next, CsrfConfig _config,
		    std::unique_ptr<CsrfTokenStore> _store,
		    CsrfRandom &_random);

	/**
	 * Construct with a #CookieCsrfTokenStore and libsodium's
	 * random number generator.
	 *
	 * Throws std::invalid_argument if the configuration is not
	 * usable or if libsodium cannot be initialized.
	 */
	CsrfHandler(HttpRequestHandler &_next, const CsrfAuthKey &key,
		    CsrfConfig _config={});

	~CsrfHandler() noexcept override;

	const CsrfConfig &GetConfig() const noexcept {
		return config;
	}

	/**
	 * Throws (without sending a response) if no token could be
	 * generated.
	 */
	void HandleHttpRequest(IncomingHttpRequest &request) override;

private:
	void OnRejected(IncomingHttpRequest &request);
};
