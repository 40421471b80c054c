// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <string_view>

#include <string.h>

[[gnu::pure]] [[gnu::nonnull]]
inline bool
StringIsEqual(const char *a, const char *b) noexcept
{
	return strcmp(a, b) == 0;
}

/**
 * Checks whether the string begins with the specified prefix.  If
 * yes, then a pointer to the remainder of the string is returned,
 * else nullptr.
 */
[[gnu::pure]] [[gnu::nonnull]]
inline const char *
StringAfterPrefix(const char *haystack, std::string_view needle) noexcept
{
	return strncmp(haystack, needle.data(), needle.size()) == 0
		? haystack + needle.size()
		: nullptr;
}
