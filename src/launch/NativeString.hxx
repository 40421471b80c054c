// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <string>
#include <string_view>

/**
 * Verify that the given string can be passed to the kernel as a
 * null-terminated string.
 *
 * Throws #StringConversionError if it contains a null byte.
 */
void
CheckNativeString(std::string_view s);

/**
 * Convert the given string to an owned native string.
 *
 * Throws #StringConversionError if it contains a null byte.
 */
[[nodiscard]]
std::string
ToNativeString(std::string_view s);
