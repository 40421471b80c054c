// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <span>

#include <sys/types.h>

/**
 * An OO wrapper for a UNIX file descriptor.
 *
 * This class does not use RAII; see #UniqueFileDescriptor for an
 * owning variant.
 */
class FileDescriptor {
protected:
	int fd;

public:
	FileDescriptor() = default;

	explicit constexpr FileDescriptor(int _fd) noexcept
		:fd(_fd) {}

	constexpr bool operator==(const FileDescriptor &other) const noexcept = default;

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	constexpr int Get() const noexcept {
		return fd;
	}

	static constexpr FileDescriptor Undefined() noexcept {
		return FileDescriptor(-1);
	}

	/**
	 * Open the file read-only with O_CLOEXEC and O_NOCTTY.
	 *
	 * @return false on error (with errno set)
	 */
	bool OpenReadOnly(const char *pathname) noexcept;

	[[nodiscard]]
	ssize_t Read(std::span<std::byte> dest) const noexcept;

	void Close() noexcept;
};
