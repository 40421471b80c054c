// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * A caller-supplied string cannot be represented as a native
 * (null-terminated) string because it contains a null byte.
 */
class StringConversionError : public std::invalid_argument {
	std::size_t position;

public:
	StringConversionError(const std::string &_msg,
			      std::size_t _position)
		:std::invalid_argument(_msg), position(_position) {}

	/**
	 * The offset of the first offending byte.
	 */
	std::size_t GetPosition() const noexcept {
		return position;
	}
};
