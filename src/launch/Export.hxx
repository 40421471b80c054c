// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <forward_list>
#include <span>
#include <string>
#include <utility>
#include <vector>

class LaunchCommand;

/**
 * A #LaunchCommand flattened into the null-terminated arrays which
 * are passed to execve().  The #LaunchCommand is not modified, but
 * it must outlive this object because the argument strings are not
 * copied.
 */
class ExportedCommand {
	/**
	 * String allocations for the environment.
	 */
	std::forward_list<std::string> strings;

	std::vector<const char *> args;
	std::vector<const char *> env;

	const char *path;

	/**
	 * If true, then the ambient environment shall be passed to
	 * the child process verbatim, and #env is empty.
	 */
	bool inherit_env;

public:
	explicit ExportedCommand(const LaunchCommand &command);

	ExportedCommand(ExportedCommand &&) noexcept = default;
	ExportedCommand &operator=(ExportedCommand &&) noexcept = default;

	ExportedCommand(const ExportedCommand &) = delete;
	ExportedCommand &operator=(const ExportedCommand &) = delete;

	/**
	 * The path of the executable.
	 */
	const char *GetPath() const noexcept {
		return path;
	}

	/**
	 * The null-terminated argument vector.
	 */
	char *const*GetArgv() const noexcept {
		return const_cast<char *const*>(args.data());
	}

	/**
	 * The arguments without the terminating nullptr.
	 */
	std::span<const char *const> GetArgs() const noexcept {
		return {args.data(), args.size() - 1};
	}

	bool InheritsEnvironment() const noexcept {
		return inherit_env;
	}

	/**
	 * The null-terminated environment ("NAME=VALUE" strings) or
	 * nullptr if the ambient environment shall be used.
	 */
	char *const*GetEnvp() const noexcept {
		return inherit_env
			? nullptr
			: const_cast<char *const*>(env.data());
	}

	/**
	 * The environment without the terminating nullptr; empty if
	 * InheritsEnvironment().
	 */
	std::span<const char *const> GetEnv() const noexcept {
		if (inherit_env)
			return {};

		return {env.data(), env.size() - 1};
	}

private:
	void PutEnv(std::string &&s) noexcept {
		strings.emplace_front(std::move(s));
		env.push_back(strings.front().c_str());
	}
};
