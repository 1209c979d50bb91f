// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "csrf-protect/Protocol.hxx"
#include "http/CookieSameSite.hxx"
#include "http/Method.hxx"

#include <chrono>
#include <functional>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

class HttpRequestHandler;
struct SetCookieAttributes;

/**
 * Settings of #CsrfHandler.
 */
struct CsrfConfig {
	std::string cookie_name{CsrfProtect::DEFAULT_COOKIE_NAME};

	/**
	 * The "Path" cookie attribute; empty means the client
	 * defaults to the path of the request.
	 */
	std::string cookie_path;

	/**
	 * The "Domain" cookie attribute; empty means the cookie is
	 * host-only.
	 */
	std::string cookie_domain;

	/**
	 * The "Max-Age" cookie attribute.  Zero omits the attribute
	 * and disables expiry checks; a negative value deletes the
	 * cookie.
	 */
	std::chrono::seconds max_age = CsrfProtect::DEFAULT_MAX_AGE;

	bool secure = true;
	bool http_only = true;

	CookieSameSite same_site = CookieSameSite::DEFAULT;

	/**
	 * The request header which is checked for a token first.
	 */
	std::string request_header{CsrfProtect::DEFAULT_REQUEST_HEADER};

	/**
	 * The form field which is checked if the header is absent.
	 */
	std::string field_name{CsrfProtect::DEFAULT_FIELD_NAME};

	/**
	 * Invoked for rejected requests.  If nullptr, then a plain
	 * "403 Forbidden" response is generated.  Not owned.
	 */
	HttpRequestHandler *error_handler = nullptr;

	/**
	 * Requests with these methods are never checked.
	 */
	HttpMethodSet safe_methods = HttpMethodSet::Safe();

	/**
	 * Throws std::invalid_argument if a setting is not usable.
	 */
	void Check() const;

	/**
	 * The returned object refers to strings owned by this object.
	 */
	[[gnu::pure]]
	SetCookieAttributes GetCookieAttributes() const noexcept;
};

/**
 * A function which modifies one #CsrfConfig setting.
 */
using CsrfOption = std::function<void(CsrfConfig &)>;

CsrfOption
CsrfMaxAge(std::chrono::seconds max_age);

CsrfOption
CsrfDomain(std::string_view domain);

CsrfOption
CsrfPath(std::string_view path);

CsrfOption
CsrfSecure(bool secure);

CsrfOption
CsrfHttpOnly(bool http_only);

CsrfOption
CsrfSameSite(CookieSameSite same_site);

CsrfOption
CsrfErrorHandler(HttpRequestHandler &handler);

CsrfOption
CsrfRequestHeader(std::string_view name);

CsrfOption
CsrfFieldName(std::string_view name);

CsrfOption
CsrfCookieName(std::string_view name);

CsrfOption
CsrfSafeMethods(HttpMethodSet methods);

/**
 * Apply the options to a default #CsrfConfig in the given order;
 * later options override earlier ones.
 */
CsrfConfig
MakeCsrfConfig(std::span<const CsrfOption> options);

CsrfConfig
MakeCsrfConfig(std::initializer_list<CsrfOption> options);
