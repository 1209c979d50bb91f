// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Token.hxx"

#include <optional>

struct IncomingHttpRequest;

/**
 * Persists the #CsrfRawToken of a client between requests.
 */
class CsrfTokenStore {
public:
	virtual ~CsrfTokenStore() noexcept = default;

	/**
	 * Load the token which was stored for the client which sent
	 * this request.
	 *
	 * @return the token or std::nullopt if none was stored or the
	 * stored token is not usable (tampered, expired, malformed)
	 */
	virtual std::optional<CsrfRawToken> Load(const IncomingHttpRequest &request) const noexcept = 0;

	/**
	 * Store the token by adding to IncomingHttpRequest::response_headers.
	 *
	 * Throws on error.
	 */
	virtual void Save(IncomingHttpRequest &request,
			  const CsrfRawToken &token) = 0;

	/**
	 * Generate a new token.
	 *
	 * Throws on error.
	 */
	virtual CsrfRawToken New() = 0;
};
