// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

/* a collection of well-known HTTP header names; lookups in
   #StringMap are case-insensitive */

constexpr std::string_view content_type_header{"content-type"};
constexpr std::string_view cookie_header{"cookie"};
constexpr std::string_view set_cookie_header{"set-cookie"};
constexpr std::string_view vary_header{"vary"};
