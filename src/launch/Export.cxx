// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Export.hxx"
#include "Command.hxx"

#include <fmt/core.h>

#include <cassert>

ExportedCommand::ExportedCommand(const LaunchCommand &command)
	:path(command.GetProgram().c_str()),
	 inherit_env(command.GetEnvironment().IsInherited())
{
	const auto &src_args = command.GetArgs();
	assert(!src_args.empty());

	args.reserve(src_args.size() + 1);
	for (const auto &i : src_args)
		args.push_back(i.c_str());
	args.push_back(nullptr);

	if (!inherit_env) {
		const auto &map = command.GetEnvironment().GetMap();
		env.reserve(map.size() + 1);
		for (const auto &[name, value] : map)
			PutEnv(fmt::format("{}={}", name, value));
		env.push_back(nullptr);
	}
}
