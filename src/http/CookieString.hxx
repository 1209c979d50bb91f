// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Cookie string utilities according to RFC 6265 4.1.1.
 */

#pragma once

#include <string_view>

/**
 * Parse the next cookie value.  Unlike RFC 6265, this accepts
 * whitespace and commas inside unquoted values, because some
 * clients send them anyway.  Quotes are removed.
 */
std::string_view
cookie_next_rfc_ignorant_value(std::string_view &input) noexcept;
