// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "launch/Stdio.hxx"
#include "lib/fmt/StdioFormatter.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

static_assert(GetDefaultStdio(SpawnMode::SPAWN) == Stdio::Inherit());
static_assert(GetDefaultStdio(SpawnMode::STATUS) == Stdio::Inherit());
static_assert(GetDefaultStdio(SpawnMode::OUTPUT) == Stdio::Pipe());

TEST(Stdio, Resolve)
{
	const std::optional<Stdio> none;

	EXPECT_EQ(ResolveStdio(none, SpawnMode::SPAWN), Stdio::Inherit());
	EXPECT_EQ(ResolveStdio(none, SpawnMode::STATUS), Stdio::Inherit());
	EXPECT_EQ(ResolveStdio(none, SpawnMode::OUTPUT), Stdio::Pipe());

	const std::optional<Stdio> null{Stdio::Null()};
	EXPECT_EQ(ResolveStdio(null, SpawnMode::SPAWN), Stdio::Null());
	EXPECT_EQ(ResolveStdio(null, SpawnMode::OUTPUT), Stdio::Null());

	/* an explicit "inherit" beats the pipe default */
	const std::optional<Stdio> inherit{Stdio::Inherit()};
	EXPECT_EQ(ResolveStdio(inherit, SpawnMode::OUTPUT), Stdio::Inherit());
}

TEST(Stdio, FileDescriptor)
{
	const auto s = Stdio::FromFileDescriptor(FileDescriptor{5});
	EXPECT_EQ(s.GetType(), Stdio::Type::FD);
	EXPECT_EQ(s.GetFileDescriptor().Get(), 5);
	EXPECT_NE(s, Stdio::FromFileDescriptor(FileDescriptor{6}));
	EXPECT_NE(s, Stdio::Inherit());
}

TEST(Stdio, Parse)
{
	EXPECT_EQ(ParseStdio("inherit"), Stdio::Inherit());
	EXPECT_EQ(ParseStdio("pipe"), Stdio::Pipe());
	EXPECT_EQ(ParseStdio("null"), Stdio::Null());
	EXPECT_THROW(ParseStdio("fd"), std::invalid_argument);
	EXPECT_THROW(ParseStdio(""), std::invalid_argument);

	EXPECT_EQ(ParseSpawnMode("spawn"), SpawnMode::SPAWN);
	EXPECT_EQ(ParseSpawnMode("status"), SpawnMode::STATUS);
	EXPECT_EQ(ParseSpawnMode("output"), SpawnMode::OUTPUT);
	EXPECT_THROW(ParseSpawnMode("exec"), std::invalid_argument);
}

TEST(Stdio, Format)
{
	EXPECT_EQ(fmt::format("{}", Stdio::Inherit()), "inherit");
	EXPECT_EQ(fmt::format("{}", Stdio::Pipe()), "pipe");
	EXPECT_EQ(fmt::format("{}", Stdio::Null()), "null");
	EXPECT_EQ(fmt::format("{}", Stdio::FromFileDescriptor(FileDescriptor{3})),
		  "fd 3");
}
