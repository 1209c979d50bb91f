// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Token.hxx"
#include "Failure.hxx"

#include <optional>
#include <string>

struct CsrfConfig;
struct IncomingHttpRequest;

/**
 * Find the token submitted with the request: the configured request
 * header first, then the configured field of an
 * "application/x-www-form-urlencoded" body.
 *
 * @return the (still encoded) token or std::nullopt if there is
 * none
 */
std::optional<std::string>
FindSubmittedCsrfToken(const CsrfConfig &config,
		       const IncomingHttpRequest &request);

/**
 * Decide whether the request may pass.  Requests with a safe method
 * and requests marked with CsrfUnsafeSkipCheck() always pass; all
 * others must submit a masked copy of the #stored token.
 *
 * @return CsrfFailure::NONE if the request is accepted
 */
CsrfFailure
ValidateCsrfRequest(const CsrfConfig &config,
		    const IncomingHttpRequest &request,
		    const CsrfRawToken &stored);
