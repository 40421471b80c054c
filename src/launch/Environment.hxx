// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "EnvironmentMap.hxx"

#include <cassert>
#include <cstdint>
#include <string>
#include <string_view>

class AmbientEnvironment;

/**
 * The environment of a child process which is about to be launched.
 *
 * It starts in state #INHERITED, which means the child gets the
 * ambient environment verbatim.  The first modification copies the
 * ambient environment into the map ("materialization") and then
 * applies the change on top of that copy.  Clear() discards
 * everything and detaches from the ambient environment for good.
 */
class ChildEnvironment {
public:
	enum class State : uint_least8_t {
		/**
		 * No override; use the ambient environment.
		 */
		INHERITED,

		/**
		 * The map was initialized from a snapshot of the
		 * ambient environment.
		 */
		MATERIALIZED,

		/**
		 * The map was cleared explicitly and is not derived
		 * from the ambient environment.
		 */
		CLEARED,
	};

private:
	State state = State::INHERITED;

	/**
	 * Unused in state #INHERITED.
	 */
	EnvironmentMap map;

public:
	State GetState() const noexcept {
		return state;
	}

	bool IsInherited() const noexcept {
		return state == State::INHERITED;
	}

	/**
	 * The overridden environment.  Must not be called in state
	 * #INHERITED.
	 */
	const EnvironmentMap &GetMap() const noexcept {
		assert(!IsInherited());

		return map;
	}

	/**
	 * Switch from #INHERITED to #MATERIALIZED by copying the
	 * ambient environment.  No-op in all other states.
	 */
	void Materialize(const AmbientEnvironment &ambient);

	void Set(const AmbientEnvironment &ambient,
		 std::string &&name, std::string &&value);

	/**
	 * Remove a variable.  A name which does not exist is not an
	 * error.
	 */
	void Remove(const AmbientEnvironment &ambient,
		    std::string_view name);

	void Clear() noexcept {
		map.clear();
		state = State::CLEARED;
	}

	/**
	 * Look up the effective value of one variable without
	 * materializing.
	 *
	 * @return the value or nullptr if the variable is not set
	 */
	[[gnu::pure]]
	const char *Get(const AmbientEnvironment &ambient,
			std::string_view name) const noexcept;

	/**
	 * Returns the environment the child process would get.
	 */
	EnvironmentMap GetEffective(const AmbientEnvironment &ambient) const;
};
