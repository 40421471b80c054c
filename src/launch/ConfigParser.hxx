// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Command.hxx"
#include "io/config/ConfigParser.hxx"
#include "io/Logger.hxx"

#include <cassert>
#include <optional>

class AmbientEnvironment;

/**
 * Parses a configuration file describing a #LaunchCommand.  The
 * first directive must be "program"; it may be followed by "arg",
 * "setenv", "unsetenv", "clearenv", "chdir", "stdin", "stdout" and
 * "stderr" in any order.
 */
class LaunchConfigParser final : public ConfigParser {
	const LLogger logger{"launch"};

	const AmbientEnvironment &ambient;

	std::optional<LaunchCommand> command;

public:
	LaunchConfigParser() noexcept;

	explicit LaunchConfigParser(const AmbientEnvironment &_ambient) noexcept
		:ambient(_ambient) {}

	bool HasCommand() const noexcept {
		return command.has_value();
	}

	/**
	 * Returns the command.  May only be called after Finish()
	 * has returned successfully.
	 */
	LaunchCommand &GetCommand() noexcept {
		assert(command);

		return *command;
	}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
	void Finish() override;

private:
	LaunchCommand &ExpectCommand(const char *directive);
};
