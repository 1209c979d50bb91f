// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Failure.hxx"

std::string_view
GetCsrfFailureReason(CsrfFailure failure) noexcept
{
	switch (failure) {
	case CsrfFailure::NONE:
		break;

	case CsrfFailure::NO_TOKEN:
		return "CSRF token not found in request";

	case CsrfFailure::MALFORMED_TOKEN:
		return "CSRF token is malformed";

	case CsrfFailure::TOKEN_MISMATCH:
		return "CSRF token invalid";
	}

	return {};
}
