// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <string>
#include <string_view>

class StringMap;

/**
 * Does the "Content-Type" request header declare an
 * "application/x-www-form-urlencoded" body?  Parameters such as
 * "charset" are ignored.
 */
[[gnu::pure]]
bool
IsFormUrlEncoded(const StringMap &request_headers) noexcept;

/**
 * Decode one component of an "application/x-www-form-urlencoded"
 * string: '+' becomes a space and "%XX" escapes are resolved.
 *
 * @return the decoded string or std::nullopt on malformed escapes
 * (including "%00")
 */
std::optional<std::string>
UnescapeFormComponent(std::string_view src);

/**
 * Find the first field with the given name in an
 * "application/x-www-form-urlencoded" body and return its decoded
 * value.
 *
 * @return the value or std::nullopt if the field is not present or
 * its value is malformed
 */
std::optional<std::string>
ExtractFormField(std::string_view body, std::string_view name);
