// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Handler.hxx"
#include "Context.hxx"
#include "CookieStore.hxx"
#include "Random.hxx"
#include "TokenCodec.hxx"
#include "Validator.hxx"
#include "http/CommonHeaders.hxx"
#include "http/IncomingRequest.hxx"
#include "http/Method.hxx"
#include "http/Status.hxx"

#include <fmt/core.h>

CsrfHandler::CsrfHandler(HttpRequestHandler &_next, CsrfConfig _config,
			 std::unique_ptr<CsrfTokenStore> _store,
			 CsrfRandom &_random)
	:next(_next), config(std::move(_config)), random(_random),
	 store(std::move(_store))
{
	config.Check();
}

CsrfHandler::CsrfHandler(HttpRequestHandler &_next, const CsrfAuthKey &key,
			 CsrfConfig _config)
	:next(_next), config(std::move(_config)),
	 random(GetDefaultCsrfRandom())
{
	config.Check();
	store = std::make_unique<CookieCsrfTokenStore>(config, key, random);
}

CsrfHandler::~CsrfHandler() noexcept = default;

void
CsrfHandler::HandleHttpRequest(IncomingHttpRequest &request)
{
	auto token = store->Load(request);
	if (!token)
		token = store->New();

	auto &context = *(request.csrf = std::make_unique<CsrfRequestContext>());
	context.token = *token;
	context.masked_token = EncodeCsrfToken(MaskCsrfToken(random, *token));
	context.field_name = config.field_name;

	store->Save(request, *token);
	request.response_headers.Write(vary_header, "Cookie");

	context.failure = ValidateCsrfRequest(config, request, *token);
	if (context.failure == CsrfFailure::NONE)
		next.HandleHttpRequest(request);
	else
		OnRejected(request);
}

void
CsrfHandler::OnRejected(IncomingHttpRequest &request)
{
	const auto failure = GetCsrfFailure(request);

	const char *method = http_method_to_string(request.method);
	logger.Fmt(3, "Rejected {} {}: {}",
		   method != nullptr ? method : "?",
		   request.uri, GetCsrfFailureReason(failure));

	if (config.error_handler != nullptr) {
		config.error_handler->HandleHttpRequest(request);
		return;
	}

	const auto status = HttpStatus::FORBIDDEN;
	request.SendMessage(status,
			    fmt::format("{} - {}",
					http_status_reason(status),
					GetCsrfFailureReason(failure)));
}
