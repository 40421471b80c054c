// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FileDescriptor.hxx"

#include <fcntl.h>
#include <unistd.h>

bool
FileDescriptor::OpenReadOnly(const char *pathname) noexcept
{
	fd = ::open(pathname, O_RDONLY|O_CLOEXEC|O_NOCTTY);
	return IsDefined();
}

ssize_t
FileDescriptor::Read(std::span<std::byte> dest) const noexcept
{
	return ::read(fd, dest.data(), dest.size());
}

void
FileDescriptor::Close() noexcept
{
	::close(fd);
	fd = -1;
}
