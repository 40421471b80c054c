// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "EnvironmentMap.hxx"

#include <optional>
#include <string_view>
#include <utility>

/**
 * Read-only access to the environment a child process inherits if
 * its #LaunchCommand never overrides it.
 */
class AmbientEnvironment {
public:
	virtual ~AmbientEnvironment() noexcept = default;

	/**
	 * Copy all variables into a new map.
	 */
	virtual EnvironmentMap Snapshot() const = 0;

	/**
	 * Look up one variable.
	 *
	 * @return the value or nullptr if the variable does not exist
	 */
	virtual const char *Get(std::string_view name) const noexcept = 0;
};

/**
 * The environment of this process, i.e. the global "environ"
 * variable.
 *
 * No locking is done; callers must not modify the environment
 * (e.g. with setenv()) in other threads while this object is being
 * read.
 */
class ProcessEnvironment final : public AmbientEnvironment {
public:
	/* virtual methods from class AmbientEnvironment */
	EnvironmentMap Snapshot() const override;
	const char *Get(std::string_view name) const noexcept override;
};

/**
 * Returns the process-wide #ProcessEnvironment instance.
 */
const AmbientEnvironment &
GetProcessEnvironment() noexcept;

/**
 * Split one "NAME=VALUE" entry.  A leading '=' is considered part of
 * the name.
 *
 * @return the name and the value (which points into the given
 * string), or std::nullopt if there is no '='
 */
[[gnu::pure]]
std::optional<std::pair<std::string_view, const char *>>
SplitEnvironmentEntry(const char *entry) noexcept;
