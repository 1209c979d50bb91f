// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "http/Chars.hxx"
#include "http/SetCookie.hxx"

#include <algorithm>
#include <stdexcept>

static bool
IsCookieAttributeValue(std::string_view s) noexcept
{
	return std::none_of(s.begin(), s.end(), [](char ch){
		return ch == ';' || char_is_http_ctl(ch) ||
			!char_is_http_char(ch);
	});
}

void
CsrfConfig::Check() const
{
	if (!http_is_token(cookie_name))
		throw std::invalid_argument{"Invalid CSRF cookie name"};

	if (!http_is_token(request_header))
		throw std::invalid_argument{"Invalid CSRF request header name"};

	if (field_name.empty())
		throw std::invalid_argument{"Empty CSRF form field name"};

	if (!IsCookieAttributeValue(cookie_path))
		throw std::invalid_argument{"Invalid CSRF cookie path"};

	if (!IsCookieAttributeValue(cookie_domain))
		throw std::invalid_argument{"Invalid CSRF cookie domain"};

	if (same_site == CookieSameSite::NONE && !secure)
		throw std::invalid_argument{"SameSite=None requires a secure CSRF cookie"};
}

SetCookieAttributes
CsrfConfig::GetCookieAttributes() const noexcept
{
	SetCookieAttributes a;
	a.path = cookie_path;
	a.domain = cookie_domain;

	if (max_age != std::chrono::seconds::zero())
		a.max_age = max_age;

	a.secure = secure;
	a.http_only = http_only;
	a.same_site = same_site;
	return a;
}

CsrfOption
CsrfMaxAge(std::chrono::seconds max_age)
{
	return [max_age](CsrfConfig &config){
		config.max_age = max_age;
	};
}

CsrfOption
CsrfDomain(std::string_view domain)
{
	return [domain = std::string{domain}](CsrfConfig &config){
		config.cookie_domain = domain;
	};
}

CsrfOption
CsrfPath(std::string_view path)
{
	return [path = std::string{path}](CsrfConfig &config){
		config.cookie_path = path;
	};
}

CsrfOption
CsrfSecure(bool secure)
{
	return [secure](CsrfConfig &config){
		config.secure = secure;
	};
}

CsrfOption
CsrfHttpOnly(bool http_only)
{
	return [http_only](CsrfConfig &config){
		config.http_only = http_only;
	};
}

CsrfOption
CsrfSameSite(CookieSameSite same_site)
{
	return [same_site](CsrfConfig &config){
		config.same_site = same_site;
	};
}

CsrfOption
CsrfErrorHandler(HttpRequestHandler &handler)
{
	return [&handler](CsrfConfig &config){
		config.error_handler = &handler;
	};
}

CsrfOption
CsrfRequestHeader(std::string_view name)
{
	return [name = std::string{name}](CsrfConfig &config){
		config.request_header = name;
	};
}

CsrfOption
CsrfFieldName(std::string_view name)
{
	return [name = std::string{name}](CsrfConfig &config){
		config.field_name = name;
	};
}

CsrfOption
CsrfCookieName(std::string_view name)
{
	return [name = std::string{name}](CsrfConfig &config){
		config.cookie_name = name;
	};
}

CsrfOption
CsrfSafeMethods(HttpMethodSet methods)
{
	return [methods](CsrfConfig &config){
		config.safe_methods = methods;
	};
}

CsrfConfig
MakeCsrfConfig(std::span<const CsrfOption> options)
{
	CsrfConfig config;
	for (const auto &i : options)
		i(config);
	return config;
}

CsrfConfig
MakeCsrfConfig(std::initializer_list<CsrfOption> options)
{
	return MakeCsrfConfig(std::span<const CsrfOption>{options.begin(), options.size()});
}
