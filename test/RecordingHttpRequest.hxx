// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/IncomingRequest.hxx"
#include "http/Headers.hxx"
#include "http/Method.hxx"
#include "http/Status.hxx"

#include <string>
#include <string_view>

/**
 * An #IncomingHttpRequest which records the response.
 */
struct RecordingHttpRequest final : IncomingHttpRequest {
	unsigned n_responses = 0;

	HttpStatus status{};
	StringMap response;
	std::string response_body;

	RecordingHttpRequest(HttpMethod _method, std::string_view _uri="/") noexcept
		:IncomingHttpRequest(_method, _uri) {}

	bool HasResponse() const noexcept {
		return n_responses > 0;
	}

	/**
	 * Submit a form field in an "application/x-www-form-urlencoded"
	 * body.
	 */
	void SetFormBody(std::string_view _body) {
		headers.Set("content-type", "application/x-www-form-urlencoded");
		body = _body;
	}

protected:
	/* virtual methods from class IncomingHttpRequest */
	void OnResponse(HttpStatus _status, HttpHeaders &&_headers,
			std::string_view _body) noexcept override {
		++n_responses;
		status = _status;
		response = std::move(_headers).ToMap();
		response_body = _body;
	}
};
