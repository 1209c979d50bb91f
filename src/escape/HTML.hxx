// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

/**
 * Escape the HTML special characters (&amp;, &quot;, &apos;, &lt;,
 * &gt;) so the string can be used as element text or as a quoted
 * attribute value.
 */
std::string
HtmlEscape(std::string_view src) noexcept;
