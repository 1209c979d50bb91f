// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "Config.hxx"
#include "Random.hxx"
#include "http/CookieSameSite.hxx"
#include "http/Method.hxx"
#include "io/LineParser.hxx"
#include "io/Logger.hxx"
#include "util/StringAPI.hxx"

#include <charconv>
#include <cstdint>
#include <cstring>
#include <string>

static std::chrono::seconds
ParseMaxAge(const char *s)
{
	std::int_least64_t value;
	const char *end = s + std::strlen(s);
	const auto [ptr, ec] = std::from_chars(s, end, value);
	if (ec != std::errc{} || ptr != end)
		throw LineParser::Error("Not a valid integer");

	return std::chrono::seconds{value};
}

static HttpMethodSet
ParseSafeMethods(LineParser &line)
{
	HttpMethodSet methods;

	do {
		const char *name = line.ExpectValue();
		const auto method = ParseHttpMethod(name);
		if (method == HttpMethod::UNKNOWN)
			throw LineParser::Error(std::string{"Unknown HTTP method: "} + name);

		methods.Add(method);
	} while (!line.IsEnd());

	return methods;
}

void
CsrfConfigParser::ParseLine(LineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "cookie_name")) {
		config.cookie_name = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "cookie_path")) {
		config.cookie_path = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "cookie_domain")) {
		config.cookie_domain = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "max_age")) {
		config.max_age = ParseMaxAge(line.ExpectValueAndEnd());
	} else if (StringIsEqual(word, "secure")) {
		config.secure = line.NextBool();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "http_only")) {
		config.http_only = line.NextBool();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "same_site")) {
		config.same_site = ParseCookieSameSite(line.ExpectValueAndEnd());
	} else if (StringIsEqual(word, "request_header")) {
		config.request_header = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "field_name")) {
		config.field_name = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "safe_methods")) {
		config.safe_methods = ParseSafeMethods(line);
	} else if (StringIsEqual(word, "auth_key")) {
		auth_key = CsrfAuthKey::Parse(line.ExpectValueAndEnd());
	} else
		throw LineParser::Error("Unknown option");
}

void
CsrfConfigParser::Finish()
{
	config.Check();
}

CsrfAuthKey
LoadCsrfConfigFile(const boost::filesystem::path &path, CsrfConfig &config)
{
	std::optional<CsrfAuthKey> auth_key;

	CsrfConfigParser parser(config, auth_key);
	CommentConfigParser parser2(parser);
	IncludeConfigParser parser3(boost::filesystem::path{path}, parser2);

	ParseConfigFile(path, parser3);

	if (!auth_key) {
		Logger{"csrf"}(2, "No auth_key configured; generating a random one");
		auth_key = CsrfAuthKey::Generate(GetDefaultCsrfRandom());
	}

	return *auth_key;
}
