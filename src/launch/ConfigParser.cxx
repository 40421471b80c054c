// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "Ambient.hxx"
#include "io/config/LineParser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringCompare.hxx"

LaunchConfigParser::LaunchConfigParser() noexcept
	:LaunchConfigParser(GetProcessEnvironment()) {}

LaunchCommand &
LaunchConfigParser::ExpectCommand(const char *directive)
{
	if (!command)
		throw FmtRuntimeError("'program' expected before '{}'",
				      directive);

	return *command;
}

static Stdio
ExpectStdio(LineParser &line)
{
	const char *value = line.ExpectWord();
	line.ExpectEnd();

	try {
		return ParseStdio(value);
	} catch (const std::invalid_argument &e) {
		throw LineParser::Error{e.what()};
	}
}

void
LaunchConfigParser::ParseLine(LineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "program")) {
		if (command)
			throw LineParser::Error("Duplicate 'program'");

		const char *path = line.ExpectValueAndEnd();
		command.emplace(path, ambient);
	} else if (StringIsEqual(word, "arg")) {
		auto &c = ExpectCommand(word);

		/* an empty argument is allowed if quoted */
		const char *value = line.NextValue();
		if (value == nullptr)
			throw LineParser::Error("Value expected");

		line.ExpectEnd();
		c.Arg(value);
	} else if (StringIsEqual(word, "setenv")) {
		auto &c = ExpectCommand(word);

		const char *name = line.ExpectValue();
		const char *value = line.NextValue();
		if (value == nullptr)
			throw LineParser::Error("Value expected after variable name");

		line.ExpectEnd();
		c.SetEnv(name, value);
	} else if (StringIsEqual(word, "unsetenv")) {
		auto &c = ExpectCommand(word);
		c.RemoveEnv(line.ExpectValueAndEnd());
	} else if (StringIsEqual(word, "clearenv")) {
		auto &c = ExpectCommand(word);
		line.ExpectEnd();

		if (!c.GetEnvironment().IsInherited())
			logger(4, "'clearenv' discards previous environment settings");

		c.ClearEnv();
	} else if (StringIsEqual(word, "chdir")) {
		auto &c = ExpectCommand(word);

		if (c.GetWorkingDirectory() != nullptr)
			logger.Fmt(4, "Overriding working directory '{}'",
				   c.GetWorkingDirectory());

		c.SetWorkingDirectory(line.ExpectValueAndEnd());
	} else if (StringIsEqual(word, "stdin")) {
		auto &c = ExpectCommand(word);
		const auto stdio = ExpectStdio(line);

		if (c.GetStdin())
			logger(4, "Overriding previous 'stdin'");

		c.SetStdin(stdio);
	} else if (StringIsEqual(word, "stdout")) {
		auto &c = ExpectCommand(word);
		const auto stdio = ExpectStdio(line);

		if (c.GetStdout())
			logger(4, "Overriding previous 'stdout'");

		c.SetStdout(stdio);
	} else if (StringIsEqual(word, "stderr")) {
		auto &c = ExpectCommand(word);
		const auto stdio = ExpectStdio(line);

		if (c.GetStderr())
			logger(4, "Overriding previous 'stderr'");

		c.SetStderr(stdio);
	} else
		throw FmtRuntimeError("Unknown directive: '{}'", word);
}

void
LaunchConfigParser::Finish()
{
	if (!command)
		throw LineParser::Error("No 'program' specified");

	ConfigParser::Finish();
}
