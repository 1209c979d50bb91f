// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * HTTP string utilities according to RFC 9110 5.6.
 */

#pragma once

#include <string_view>

std::string_view
http_next_token(std::string_view &input) noexcept;

/**
 * Parse a quoted string, but do not unquote.  Therefore, it does not
 * allocate memory and does not copy data, it just returns a view on
 * the input string between the quotes.
 */
std::string_view
http_next_quoted_string_raw(std::string_view &input) noexcept;
