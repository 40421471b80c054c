// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Environment.hxx"
#include "NativeString.hxx"
#include "Stdio.hxx"

#include <concepts>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

class AmbientEnvironment;

/**
 * Describes a child process which shall be launched: the program,
 * its arguments, its environment, its working directory and its
 * standard streams.  This object only collects the configuration;
 * it never executes anything and does no I/O.  The spawner reads it
 * (see #ExportedCommand) without modifying it.
 *
 * All setters return a reference to this object to allow chaining.
 * All strings are validated by ToNativeString() before anything is
 * modified, so a #StringConversionError leaves the object unchanged.
 *
 * This class is not thread-safe; it must be owned by one thread
 * while it is being configured.
 */
class LaunchCommand {
	const AmbientEnvironment *ambient;

	/**
	 * The path of the program to be executed.
	 */
	std::string program;

	/**
	 * The argument vector.  It is never empty; the first element
	 * is argv[0], which is initialized with #program.
	 */
	std::vector<std::string> args;

	ChildEnvironment env;

	/**
	 * Change to this working directory.  If a new root directory
	 * is set up by the spawner (chroot or pivot_root), then this
	 * path is relative to the new root.  If not set, the child
	 * inherits the working directory of the spawner; what that
	 * means after a root change is decided by the spawner.
	 */
	std::optional<std::string> working_directory;

	/**
	 * Explicit overrides for the standard streams.  If not set,
	 * the default depends on the #SpawnMode; see
	 * ResolveStdio().
	 */
	std::optional<Stdio> stdin_config, stdout_config, stderr_config;

public:
	/**
	 * Throws #StringConversionError if the program path contains
	 * a null byte.
	 */
	explicit LaunchCommand(std::string_view _program);

	/**
	 * Use the given ambient environment instead of the one of
	 * this process.  It must remain valid for the lifetime of
	 * this object.
	 */
	LaunchCommand(std::string_view _program,
		      const AmbientEnvironment &_ambient);

	/**
	 * Append one argument.
	 */
	LaunchCommand &Arg(std::string_view arg);

	/**
	 * Append all arguments of the given range, in order.
	 */
	template<std::ranges::input_range R>
	requires std::convertible_to<std::ranges::range_reference_t<R>,
				     std::string_view>
	LaunchCommand &Args(R &&r) {
		return AppendArgs(std::ranges::begin(r), std::ranges::end(r));
	}

	LaunchCommand &Args(std::initializer_list<std::string_view> l) {
		return AppendArgs(l.begin(), l.end());
	}

	/**
	 * Add or replace an environment variable.  On the first
	 * modification, the ambient environment is copied.
	 */
	LaunchCommand &SetEnv(std::string_view name, std::string_view value);

	/**
	 * Remove an environment variable.  On the first modification,
	 * the ambient environment is copied.  Removing a variable
	 * which does not exist is not an error.
	 */
	LaunchCommand &RemoveEnv(std::string_view name);

	/**
	 * Clear the whole environment.  Variables set before are
	 * discarded, and the ambient environment will not be
	 * consulted anymore; variables set afterwards are added to
	 * the empty environment.
	 */
	LaunchCommand &ClearEnv() noexcept {
		env.Clear();
		return *this;
	}

	/**
	 * Copy the ambient environment now, without modifying it.
	 * Does nothing if the environment was already modified.
	 */
	LaunchCommand &MaterializeEnvironment() {
		env.Materialize(*ambient);
		return *this;
	}

	LaunchCommand &SetWorkingDirectory(std::string_view path);

	LaunchCommand &SetStdin(Stdio config) noexcept {
		stdin_config = config;
		return *this;
	}

	LaunchCommand &SetStdout(Stdio config) noexcept {
		stdout_config = config;
		return *this;
	}

	LaunchCommand &SetStderr(Stdio config) noexcept {
		stderr_config = config;
		return *this;
	}

	const AmbientEnvironment &GetAmbientEnvironment() const noexcept {
		return *ambient;
	}

	const std::string &GetProgram() const noexcept {
		return program;
	}

	const std::vector<std::string> &GetArgs() const noexcept {
		return args;
	}

	const ChildEnvironment &GetEnvironment() const noexcept {
		return env;
	}

	/**
	 * Look up the value the given environment variable will have
	 * in the child process.  This does not materialize the
	 * environment.
	 *
	 * @return the value or nullptr if the variable is not set
	 */
	[[gnu::pure]]
	const char *GetEnv(std::string_view name) const noexcept {
		return env.Get(*ambient, name);
	}

	/**
	 * Returns the complete environment the child process will
	 * get.  This does not materialize the environment.
	 */
	EnvironmentMap GetEffectiveEnvironment() const {
		return env.GetEffective(*ambient);
	}

	/**
	 * @return the working directory or nullptr if the child
	 * shall inherit the spawner's working directory
	 */
	const char *GetWorkingDirectory() const noexcept {
		return working_directory ? working_directory->c_str() : nullptr;
	}

	const std::optional<Stdio> &GetStdin() const noexcept {
		return stdin_config;
	}

	const std::optional<Stdio> &GetStdout() const noexcept {
		return stdout_config;
	}

	const std::optional<Stdio> &GetStderr() const noexcept {
		return stderr_config;
	}

private:
	template<typename I, typename S>
	LaunchCommand &AppendArgs(I i, S end) {
		std::vector<std::string> converted;
		for (; i != end; ++i)
			converted.emplace_back(ToNativeString(std::string_view{*i}));

		args.insert(args.end(),
			    std::make_move_iterator(converted.begin()),
			    std::make_move_iterator(converted.end()));
		return *this;
	}
};
