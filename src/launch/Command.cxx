// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Command.hxx"
#include "Ambient.hxx"

LaunchCommand::LaunchCommand(std::string_view _program)
	:LaunchCommand(_program, GetProcessEnvironment()) {}

LaunchCommand::LaunchCommand(std::string_view _program,
			     const AmbientEnvironment &_ambient)
	:ambient(&_ambient),
	 program(ToNativeString(_program)),
	 args{program}
{
}

LaunchCommand &
LaunchCommand::Arg(std::string_view arg)
{
	args.emplace_back(ToNativeString(arg));
	return *this;
}

LaunchCommand &
LaunchCommand::SetEnv(std::string_view name, std::string_view value)
{
	/* convert both strings before materializing, so a conversion
	   error leaves the environment untouched */
	auto native_name = ToNativeString(name);
	auto native_value = ToNativeString(value);

	env.Set(*ambient, std::move(native_name), std::move(native_value));
	return *this;
}

LaunchCommand &
LaunchCommand::RemoveEnv(std::string_view name)
{
	/* a name containing a null byte cannot exist, therefore it is
	   not converted; the lookup simply fails */
	env.Remove(*ambient, name);
	return *this;
}

LaunchCommand &
LaunchCommand::SetWorkingDirectory(std::string_view path)
{
	working_directory = ToNativeString(path);
	return *this;
}
