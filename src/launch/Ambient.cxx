// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Ambient.hxx"

#include <string.h>
#include <unistd.h> // for environ

std::optional<std::pair<std::string_view, const char *>>
SplitEnvironmentEntry(const char *entry) noexcept
{
	if (*entry == 0)
		return std::nullopt;

	/* start searching at the second character: on Linux, a
	   variable name may begin with '=' */
	const char *eq = strchr(entry + 1, '=');
	if (eq == nullptr)
		return std::nullopt;

	return std::pair{std::string_view{entry, std::size_t(eq - entry)},
			 eq + 1};
}

EnvironmentMap
ProcessEnvironment::Snapshot() const
{
	EnvironmentMap map;

	if (environ == nullptr)
		return map;

	for (char **i = environ; *i != nullptr; ++i) {
		const auto entry = SplitEnvironmentEntry(*i);
		if (!entry)
			continue;

		/* the first occurrence of a duplicate name wins, just
		   like getenv() */
		map.emplace(entry->first, entry->second);
	}

	return map;
}

const char *
ProcessEnvironment::Get(std::string_view name) const noexcept
{
	if (environ == nullptr)
		return nullptr;

	for (char **i = environ; *i != nullptr; ++i) {
		const auto entry = SplitEnvironmentEntry(*i);
		if (entry && entry->first == name)
			return entry->second;
	}

	return nullptr;
}

const AmbientEnvironment &
GetProcessEnvironment() noexcept
{
	static const ProcessEnvironment instance;
	return instance;
}
