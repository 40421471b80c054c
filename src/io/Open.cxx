// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Open.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

UniqueFileDescriptor
OpenReadOnly(const char *path)
{
	FileDescriptor fd;
	if (!fd.OpenReadOnly(path))
		throw FmtErrno("Failed to open '{}'", path);

	return UniqueFileDescriptor{fd};
}
