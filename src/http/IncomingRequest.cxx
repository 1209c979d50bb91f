// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "IncomingRequest.hxx"
#include "CommonHeaders.hxx"
#include "Status.hxx"
#include "csrf/Context.hxx"

IncomingHttpRequest::IncomingHttpRequest(HttpMethod _method,
					 std::string_view _uri) noexcept
	:method(_method), uri(_uri)
{
}

IncomingHttpRequest::~IncomingHttpRequest() noexcept = default;

void
IncomingHttpRequest::SendResponse(HttpStatus status,
				  HttpHeaders &&_response_headers,
				  std::string_view response_body) noexcept
{
	HttpHeaders headers = std::move(response_headers);
	headers.Merge(std::move(_response_headers));
	OnResponse(status, std::move(headers), response_body);
}

void
IncomingHttpRequest::SendMessage(HttpStatus status,
				 std::string_view msg) noexcept
{
	HttpHeaders headers;
	headers.Write(content_type_header, "text/plain");
	SendResponse(status, std::move(headers), msg);
}
