// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "launch/Stdio.hxx"

#include <fmt/format.h>

template<>
struct fmt::formatter<Stdio> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(const Stdio &stdio, FormatContext &ctx) const {
		if (stdio.GetType() == Stdio::Type::FD)
			return fmt::format_to(ctx.out(), "fd {}",
					      stdio.GetFileDescriptor().Get());

		return formatter<string_view>::format(ToString(stdio.GetType()),
						      ctx);
	}
};
