// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "AuthKey.hxx"
#include "io/ConfigParser.hxx"

#include <optional>

struct CsrfConfig;

/**
 * Parses the settings of #CsrfHandler, one setting per line:
 *
 *   cookie_name _csrf
 *   cookie_path "/"
 *   max_age 3600
 *   secure yes
 *   same_site strict
 *   safe_methods GET HEAD
 *   auth_key 000102...1f
 */
class CsrfConfigParser final : public ConfigParser {
	CsrfConfig &config;

	std::optional<CsrfAuthKey> &auth_key;

public:
	CsrfConfigParser(CsrfConfig &_config,
			 std::optional<CsrfAuthKey> &_auth_key) noexcept
		:config(_config), auth_key(_auth_key) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

/**
 * Load settings from a file into #config.  If the file does not
 * specify "auth_key", a random key is generated; cookies issued
 * with such a key become invalid when the process is restarted.
 *
 * Throws on error.
 *
 * @return the cookie authentication key
 */
CsrfAuthKey
LoadCsrfConfigFile(const boost::filesystem::path &path, CsrfConfig &config);
