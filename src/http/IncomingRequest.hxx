// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Headers.hxx"
#include "StringMap.hxx"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

enum class HttpMethod : uint_least8_t;
enum class HttpStatus : uint_least16_t;
struct CsrfRequestContext;

/**
 * An HTTP request received by the server.  The server implements
 * OnResponse() to deliver the response to the client.
 *
 * Instances are not thread-safe; each request is handled by one
 * thread at a time.
 */
struct IncomingHttpRequest {
	/* request metadata */
	HttpMethod method;
	std::string uri;
	StringMap headers;

	/**
	 * The (completely received) request body.
	 */
	std::string body;

	/**
	 * Headers which are added to the response, no matter who sends
	 * it.  Filters use this to pass headers (e.g. "Set-Cookie")
	 * along with a response generated by a nested handler.
	 */
	HttpHeaders response_headers;

	/**
	 * The CSRF state of this request, attached by #CsrfHandler.
	 * It lives as long as this request.
	 */
	std::unique_ptr<CsrfRequestContext> csrf;

	/**
	 * If true, then #CsrfHandler does not check the token of this
	 * request even if its method is unsafe.  Set with
	 * CsrfUnsafeSkipCheck().
	 */
	bool csrf_skip_check = false;

protected:
	IncomingHttpRequest(HttpMethod _method, std::string_view _uri) noexcept;

	IncomingHttpRequest(const IncomingHttpRequest &) = delete;
	IncomingHttpRequest &operator=(const IncomingHttpRequest &) = delete;

public:
	virtual ~IncomingHttpRequest() noexcept;

	bool HasBody() const noexcept {
		return !body.empty();
	}

	/**
	 * Send the response.  The #response_headers are merged into
	 * the given headers.
	 */
	void SendResponse(HttpStatus status, HttpHeaders &&response_headers,
			  std::string_view response_body) noexcept;

	/**
	 * Send a plain-text response.
	 */
	void SendMessage(HttpStatus status, std::string_view msg) noexcept;

protected:
	virtual void OnResponse(HttpStatus status, HttpHeaders &&response_headers,
				std::string_view response_body) noexcept = 0;
};
