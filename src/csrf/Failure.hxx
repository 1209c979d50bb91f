// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "csrf-protect/Protocol.hxx"

#include <string_view>

using CsrfFailure = CsrfProtect::Failure;

/**
 * @return a human-readable description which may be sent to the
 * client
 */
[[gnu::const]]
std::string_view
GetCsrfFailureReason(CsrfFailure failure) noexcept;
