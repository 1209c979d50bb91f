// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Context.hxx"
#include "http/IncomingRequest.hxx"
#include "escape/HTML.hxx"

#include <fmt/core.h>

std::string_view
GetCsrfToken(const IncomingHttpRequest &request) noexcept
{
	if (!request.csrf)
		return {};

	return request.csrf->masked_token;
}

CsrfFailure
GetCsrfFailure(const IncomingHttpRequest &request) noexcept
{
	if (!request.csrf)
		return CsrfFailure::NONE;

	return request.csrf->failure;
}

std::string
GetCsrfTemplateField(const IncomingHttpRequest &request)
{
	if (!request.csrf)
		return {};

	return fmt::format(R"(<input type="hidden" name="{}" value="{}">)",
			   HtmlEscape(request.csrf->field_name),
			   HtmlEscape(request.csrf->masked_token));
}

void
CsrfUnsafeSkipCheck(IncomingHttpRequest &request) noexcept
{
	request.csrf_skip_check = true;
}
