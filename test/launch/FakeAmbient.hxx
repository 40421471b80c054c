// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "launch/Ambient.hxx"

#include <initializer_list>
#include <utility>

/**
 * An #AmbientEnvironment which does not touch the real process
 * environment.  It counts how often a snapshot was taken.
 */
class FakeAmbientEnvironment final : public AmbientEnvironment {
	EnvironmentMap map;

public:
	mutable unsigned n_snapshots = 0;

	FakeAmbientEnvironment(std::initializer_list<EnvironmentMap::value_type> l)
		:map(l) {}

	/* virtual methods from class AmbientEnvironment */
	EnvironmentMap Snapshot() const override {
		++n_snapshots;
		return map;
	}

	const char *Get(std::string_view name) const noexcept override {
		if (auto i = map.find(name); i != map.end())
			return i->second.c_str();
		return nullptr;
	}
};
