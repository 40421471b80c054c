// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Environment.hxx"
#include "Ambient.hxx"

#include <utility>

void
ChildEnvironment::Materialize(const AmbientEnvironment &ambient)
{
	if (state != State::INHERITED)
		return;

	/* the state is changed only after the snapshot was
	   obtained successfully */
	map = ambient.Snapshot();
	state = State::MATERIALIZED;
}

void
ChildEnvironment::Set(const AmbientEnvironment &ambient,
		      std::string &&name, std::string &&value)
{
	Materialize(ambient);
	map.insert_or_assign(std::move(name), std::move(value));
}

void
ChildEnvironment::Remove(const AmbientEnvironment &ambient,
			 std::string_view name)
{
	Materialize(ambient);

	if (auto i = map.find(name); i != map.end())
		map.erase(i);
}

const char *
ChildEnvironment::Get(const AmbientEnvironment &ambient,
		      std::string_view name) const noexcept
{
	if (IsInherited())
		return ambient.Get(name);

	if (auto i = map.find(name); i != map.end())
		return i->second.c_str();

	return nullptr;
}

EnvironmentMap
ChildEnvironment::GetEffective(const AmbientEnvironment &ambient) const
{
	if (IsInherited())
		return ambient.Snapshot();

	return map;
}
