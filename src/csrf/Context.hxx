// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Token.hxx"
#include "Failure.hxx"

#include <string>
#include <string_view>

struct IncomingHttpRequest;

/**
 * Per-request state attached to IncomingHttpRequest::csrf by
 * #CsrfHandler.
 */
struct CsrfRequestContext {
	/**
	 * The token in effect for this client (loaded from the store
	 * or newly generated).
	 */
	CsrfRawToken token;

	/**
	 * A freshly masked and encoded copy of #token for embedding
	 * in the response.
	 */
	std::string masked_token;

	/**
	 * The name of the form field which carries the token.
	 */
	std::string field_name;

	CsrfFailure failure = CsrfFailure::NONE;
};

/**
 * Return the masked token to be embedded in a form or sent in a
 * request header.  Each call with the same request returns the same
 * value.
 *
 * @return the token or an empty string if the request has not
 * passed #CsrfHandler
 */
[[gnu::pure]]
std::string_view
GetCsrfToken(const IncomingHttpRequest &request) noexcept;

/**
 * Return the reason why the request was rejected; this is meant to
 * be called by the error handler.
 */
[[gnu::pure]]
CsrfFailure
GetCsrfFailure(const IncomingHttpRequest &request) noexcept;

/**
 * Generate a hidden HTML form field containing the masked token.
 *
 * @return the HTML snippet or an empty string if the request has
 * not passed #CsrfHandler
 */
std::string
GetCsrfTemplateField(const IncomingHttpRequest &request);

/**
 * Exempt this request from the token check.  This must be called
 * before the request is passed to #CsrfHandler.
 */
void
CsrfUnsafeSkipCheck(IncomingHttpRequest &request) noexcept;
