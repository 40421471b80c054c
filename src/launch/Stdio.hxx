// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "io/FileDescriptor.hxx"

#include <cstdint>
#include <optional>
#include <string_view>

/**
 * The terminal operation which launches a #LaunchCommand.  It
 * determines the defaults for standard streams which were not
 * configured explicitly.
 */
enum class SpawnMode : uint_least8_t {
	/**
	 * Launch the process and return immediately.
	 */
	SPAWN,

	/**
	 * Launch the process and wait for its exit status.
	 */
	STATUS,

	/**
	 * Launch the process and capture its output.
	 */
	OUTPUT,
};

/**
 * Describes what a standard stream of the child process is connected
 * to.
 */
class Stdio {
public:
	enum class Type : uint_least8_t {
		/**
		 * Share the parent's file descriptor.
		 */
		INHERIT,

		/**
		 * Create a new pipe to the parent.
		 */
		PIPE,

		/**
		 * Connect to /dev/null.
		 */
		NULL_DEVICE,

		/**
		 * Use the given file descriptor.
		 */
		FD,
	};

private:
	Type type;

	/**
	 * Only used for #Type::FD.  It is not owned by this object.
	 */
	FileDescriptor fd;

	constexpr Stdio(Type _type, FileDescriptor _fd) noexcept
		:type(_type), fd(_fd) {}

public:
	static constexpr Stdio Inherit() noexcept {
		return {Type::INHERIT, FileDescriptor::Undefined()};
	}

	static constexpr Stdio Pipe() noexcept {
		return {Type::PIPE, FileDescriptor::Undefined()};
	}

	static constexpr Stdio Null() noexcept {
		return {Type::NULL_DEVICE, FileDescriptor::Undefined()};
	}

	/**
	 * Connect the stream to an existing file descriptor.  The
	 * caller remains its owner and must keep it open until the
	 * process has been launched.
	 */
	static constexpr Stdio FromFileDescriptor(FileDescriptor _fd) noexcept {
		return {Type::FD, _fd};
	}

	constexpr Type GetType() const noexcept {
		return type;
	}

	constexpr FileDescriptor GetFileDescriptor() const noexcept {
		return fd;
	}

	constexpr bool operator==(const Stdio &other) const noexcept = default;
};

/**
 * The default for a stream which was not configured: inherit for
 * #SpawnMode::SPAWN and #SpawnMode::STATUS, a pipe for
 * #SpawnMode::OUTPUT.
 */
constexpr Stdio
GetDefaultStdio(SpawnMode mode) noexcept
{
	switch (mode) {
	case SpawnMode::SPAWN:
	case SpawnMode::STATUS:
		break;

	case SpawnMode::OUTPUT:
		return Stdio::Pipe();
	}

	return Stdio::Inherit();
}

constexpr Stdio
ResolveStdio(const std::optional<Stdio> &override_, SpawnMode mode) noexcept
{
	return override_ ? *override_ : GetDefaultStdio(mode);
}

[[gnu::const]]
const char *
ToString(Stdio::Type type) noexcept;

[[gnu::const]]
const char *
ToString(SpawnMode mode) noexcept;

/**
 * Parse "inherit", "pipe" or "null".
 *
 * Throws std::invalid_argument on error.
 */
Stdio
ParseStdio(std::string_view s);

/**
 * Parse "spawn", "status" or "output".
 *
 * Throws std::invalid_argument on error.
 */
SpawnMode
ParseSpawnMode(std::string_view s);
