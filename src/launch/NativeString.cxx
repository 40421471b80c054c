// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "NativeString.hxx"
#include "Error.hxx"

#include <fmt/core.h>

void
CheckNativeString(std::string_view s)
{
	if (const auto i = s.find('\0'); i != s.npos)
		throw StringConversionError(fmt::format("Null byte at offset {} in string", i),
					    i);
}

std::string
ToNativeString(std::string_view s)
{
	CheckNativeString(s);
	return std::string{s};
}
