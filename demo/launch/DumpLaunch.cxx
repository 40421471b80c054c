// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Build a #LaunchCommand from command-line options and/or a
 * configuration file and print what would be launched.  Nothing is
 * executed.
 */

#include "launch/Command.hxx"
#include "launch/ConfigParser.hxx"
#include "launch/Export.hxx"
#include "launch/Stdio.hxx"
#include "io/config/ConfigParser.hxx"
#include "io/Logger.hxx"
#include "lib/fmt/StdioFormatter.hxx"
#include "util/PrintException.hxx"
#include "util/StringCompare.hxx"

#include <fmt/core.h>

#include <functional>
#include <span>
#include <string_view>
#include <vector>

#include <stdio.h>
#include <stdlib.h>

struct Usage {};

using Action = std::function<void(LaunchCommand &)>;

static void
Dump(const LaunchCommand &command, SpawnMode mode)
{
	const ExportedCommand e{command};

	fmt::print("program: {}\n", e.GetPath());

	unsigned i = 0;
	for (const char *arg : e.GetArgs())
		fmt::print("argv[{}]: {}\n", i++, arg);

	if (const char *wd = command.GetWorkingDirectory())
		fmt::print("working directory: {}\n", wd);
	else
		fmt::print("working directory: inherited\n");

	fmt::print("mode: {}\n", ToString(mode));
	fmt::print("stdin: {}\n", ResolveStdio(command.GetStdin(), mode));
	fmt::print("stdout: {}\n", ResolveStdio(command.GetStdout(), mode));
	fmt::print("stderr: {}\n", ResolveStdio(command.GetStderr(), mode));

	if (e.InheritsEnvironment()) {
		fmt::print("environment: inherited\n");
	} else {
		fmt::print("environment:\n");
		for (const char *var : e.GetEnv())
			fmt::print("  {}\n", var);
	}
}

int
main(int argc, char **argv)
try {
	std::span<char *const> args{argv + 1, std::size_t(argc - 1)};

	const char *config_path = nullptr;
	SpawnMode mode = SpawnMode::SPAWN;
	unsigned verbose = 1;
	std::vector<Action> actions;

	while (!args.empty() && *args.front() == '-') {
		const char *arg = args.front();
		args = args.subspan(1);

		if (StringIsEqual(arg, "--")) {
			break;
		} else if (StringIsEqual(arg, "-v")) {
			++verbose;
		} else if (const char *path = StringAfterPrefix(arg, "--config=")) {
			config_path = path;
		} else if (const char *m = StringAfterPrefix(arg, "--mode=")) {
			mode = ParseSpawnMode(m);
		} else if (const char *env = StringAfterPrefix(arg, "--env=")) {
			const std::string_view s{env};
			const auto eq = s.find('=');
			if (eq == s.npos || eq == 0)
				throw "Malformed --env parameter";

			const auto name = s.substr(0, eq), value = s.substr(eq + 1);
			actions.emplace_back([name, value](LaunchCommand &c){
				c.SetEnv(name, value);
			});
		} else if (const char *name = StringAfterPrefix(arg, "--unset-env=")) {
			actions.emplace_back([name](LaunchCommand &c){
				c.RemoveEnv(name);
			});
		} else if (StringIsEqual(arg, "--clear-env")) {
			actions.emplace_back([](LaunchCommand &c){
				c.ClearEnv();
			});
		} else if (const char *wd = StringAfterPrefix(arg, "--chdir=")) {
			actions.emplace_back([wd](LaunchCommand &c){
				c.SetWorkingDirectory(wd);
			});
		} else if (const char *stdin_mode = StringAfterPrefix(arg, "--stdin=")) {
			actions.emplace_back([stdio = ParseStdio(stdin_mode)](LaunchCommand &c){
				c.SetStdin(stdio);
			});
		} else if (const char *stdout_mode = StringAfterPrefix(arg, "--stdout=")) {
			actions.emplace_back([stdio = ParseStdio(stdout_mode)](LaunchCommand &c){
				c.SetStdout(stdio);
			});
		} else if (const char *stderr_mode = StringAfterPrefix(arg, "--stderr=")) {
			actions.emplace_back([stdio = ParseStdio(stderr_mode)](LaunchCommand &c){
				c.SetStderr(stdio);
			});
		} else
			throw Usage();
	}

	SetLogLevel(verbose);

	LaunchConfigParser parser;

	if (config_path != nullptr) {
		if (!args.empty())
			throw "Cannot combine --config with a program";

		CommentConfigParser comment_parser{parser};
		ParseConfigFile(config_path, comment_parser);
		LogFmt(2, "DumpLaunch", "Loaded '{}'", config_path);
	} else if (args.empty()) {
		throw Usage();
	}

	LaunchCommand command = config_path != nullptr
		? parser.GetCommand()
		: LaunchCommand{args.front()};

	if (config_path == nullptr)
		command.Args(args.subspan(1));

	for (const auto &action : actions)
		action(command);

	Dump(command, mode);

	return EXIT_SUCCESS;
} catch (Usage) {
	fprintf(stderr, "Usage: DumpLaunch"
		" [-v] [--config=FILE] [--mode=spawn|status|output]"
		" [--env=NAME=VALUE] [--unset-env=NAME] [--clear-env]"
		" [--chdir=PATH]"
		" [--stdin=MODE] [--stdout=MODE] [--stderr=MODE]"
		" [--] [PROGRAM [ARGS...]]\n");
	return EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
