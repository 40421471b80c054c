// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "PrintException.hxx"
#include "Exception.hxx"

#include <utility>

#include <stdio.h>

void
PrintException(std::exception_ptr ep) noexcept
{
	fprintf(stderr, "%s\n", GetFullMessage(std::move(ep), "Unknown exception", ": ").c_str());
}
