// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Stdio.hxx"

#include <fmt/core.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

const char *
ToString(Stdio::Type type) noexcept
{
	switch (type) {
	case Stdio::Type::INHERIT:
		return "inherit";

	case Stdio::Type::PIPE:
		return "pipe";

	case Stdio::Type::NULL_DEVICE:
		return "null";

	case Stdio::Type::FD:
		return "fd";
	}

	return "?";
}

const char *
ToString(SpawnMode mode) noexcept
{
	switch (mode) {
	case SpawnMode::SPAWN:
		return "spawn";

	case SpawnMode::STATUS:
		return "status";

	case SpawnMode::OUTPUT:
		return "output";
	}

	return "?";
}

Stdio
ParseStdio(std::string_view s)
{
	if (s == "inherit"sv)
		return Stdio::Inherit();
	else if (s == "pipe"sv)
		return Stdio::Pipe();
	else if (s == "null"sv)
		return Stdio::Null();
	else
		throw std::invalid_argument{fmt::format("Unknown stdio mode: '{}'", s)};
}

SpawnMode
ParseSpawnMode(std::string_view s)
{
	if (s == "spawn"sv)
		return SpawnMode::SPAWN;
	else if (s == "status"sv)
		return SpawnMode::STATUS;
	else if (s == "output"sv)
		return SpawnMode::OUTPUT;
	else
		throw std::invalid_argument{fmt::format("Unknown spawn mode: '{}'", s)};
}
