// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Validator.hxx"
#include "Config.hxx"
#include "TokenCodec.hxx"
#include "http/FormData.hxx"
#include "http/IncomingRequest.hxx"

std::optional<std::string>
FindSubmittedCsrfToken(const CsrfConfig &config,
		       const IncomingHttpRequest &request)
{
	if (const auto header = request.headers.Get(config.request_header);
	    !header.empty())
		return std::string{header};

	if (request.HasBody() && IsFormUrlEncoded(request.headers))
		if (auto field = ExtractFormField(request.body, config.field_name);
		    field && !field->empty())
			return field;

	return std::nullopt;
}

CsrfFailure
ValidateCsrfRequest(const CsrfConfig &config,
		    const IncomingHttpRequest &request,
		    const CsrfRawToken &stored)
{
	if (config.safe_methods.Contains(request.method) ||
	    request.csrf_skip_check)
		return CsrfFailure::NONE;

	const auto submitted = FindSubmittedCsrfToken(config, request);
	if (!submitted)
		return CsrfFailure::NO_TOKEN;

	const auto masked = DecodeCsrfToken(*submitted);
	if (!masked)
		return CsrfFailure::MALFORMED_TOKEN;

	const auto token = UnmaskCsrfToken(*masked);
	if (!token)
		return CsrfFailure::MALFORMED_TOKEN;

	if (!CsrfConstantTimeEquals(*token, stored))
		return CsrfFailure::TOKEN_MISMATCH;

	return CsrfFailure::NONE;
}
