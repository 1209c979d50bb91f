// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct IncomingHttpRequest;

class HttpRequestHandler {
public:
	virtual ~HttpRequestHandler() noexcept = default;

	/**
	 * Handle the request and send a response (now or later) with
	 * IncomingHttpRequest::SendResponse().
	 *
	 * Throws on fatal errors; the caller must then abort the
	 * connection instead of sending a response.
	 */
	virtual void HandleHttpRequest(IncomingHttpRequest &request) = 0;
};
