// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <functional>
#include <map>
#include <string>

/**
 * A set of environment variables.  Keys are unique and case
 * sensitive.  The transparent comparator allows lookups with
 * std::string_view.
 */
using EnvironmentMap = std::map<std::string, std::string, std::less<>>;
