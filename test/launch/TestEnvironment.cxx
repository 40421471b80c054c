// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FakeAmbient.hxx"
#include "launch/Environment.hxx"

#include <gtest/gtest.h>

#include <stdlib.h>

TEST(ChildEnvironment, Inherited)
{
	const FakeAmbientEnvironment ambient{{"PATH", "/bin"}};
	const ChildEnvironment env;

	EXPECT_TRUE(env.IsInherited());
	EXPECT_STREQ(env.Get(ambient, "PATH"), "/bin");
	EXPECT_EQ(env.Get(ambient, "FOO"), nullptr);

	const EnvironmentMap expected{{"PATH", "/bin"}};
	EXPECT_EQ(env.GetEffective(ambient), expected);
	EXPECT_TRUE(env.IsInherited());
}

TEST(ChildEnvironment, SetMaterializes)
{
	const FakeAmbientEnvironment ambient{{"PATH", "/bin"}};
	ChildEnvironment env;

	env.Set(ambient, "X", "1");

	const EnvironmentMap expected{{"PATH", "/bin"}, {"X", "1"}};
	EXPECT_EQ(env.GetState(), ChildEnvironment::State::MATERIALIZED);
	EXPECT_EQ(env.GetMap(), expected);
	EXPECT_EQ(ambient.n_snapshots, 1U);
}

TEST(ChildEnvironment, CaseSensitive)
{
	const FakeAmbientEnvironment ambient{{"Path", "a"}};
	ChildEnvironment env;

	env.Set(ambient, "PATH", "b");

	EXPECT_STREQ(env.Get(ambient, "Path"), "a");
	EXPECT_STREQ(env.Get(ambient, "PATH"), "b");
	EXPECT_EQ(env.GetMap().size(), 2U);
}

TEST(ChildEnvironment, Remove)
{
	const FakeAmbientEnvironment ambient{{"PATH", "/bin"}, {"X", "1"}};
	ChildEnvironment env;

	env.Remove(ambient, "X");

	const EnvironmentMap expected{{"PATH", "/bin"}};
	EXPECT_EQ(env.GetMap(), expected);

	env.Remove(ambient, "X");
	EXPECT_EQ(env.GetMap(), expected);
}

TEST(ChildEnvironment, Clear)
{
	const FakeAmbientEnvironment ambient{{"PATH", "/bin"}};
	ChildEnvironment env;

	env.Clear();
	EXPECT_EQ(env.GetState(), ChildEnvironment::State::CLEARED);
	EXPECT_TRUE(env.GetMap().empty());
	EXPECT_EQ(env.Get(ambient, "PATH"), nullptr);

	/* the ambient environment is never consulted after a clear */
	env.Set(ambient, "X", "1");
	env.Remove(ambient, "Y");
	EXPECT_EQ(ambient.n_snapshots, 0U);

	const EnvironmentMap expected{{"X", "1"}};
	EXPECT_EQ(env.GetEffective(ambient), expected);
}

TEST(AmbientEnvironment, SplitEntry)
{
	auto e = SplitEnvironmentEntry("FOO=bar=baz");
	ASSERT_TRUE(e);
	EXPECT_EQ(e->first, "FOO");
	EXPECT_STREQ(e->second, "bar=baz");

	e = SplitEnvironmentEntry("EMPTY=");
	ASSERT_TRUE(e);
	EXPECT_EQ(e->first, "EMPTY");
	EXPECT_STREQ(e->second, "");

	e = SplitEnvironmentEntry("=X=1");
	ASSERT_TRUE(e);
	EXPECT_EQ(e->first, "=X");
	EXPECT_STREQ(e->second, "1");

	EXPECT_FALSE(SplitEnvironmentEntry("NOVALUE"));
	EXPECT_FALSE(SplitEnvironmentEntry("="));
	EXPECT_FALSE(SplitEnvironmentEntry(""));
}

TEST(AmbientEnvironment, Process)
{
	const auto &ambient = GetProcessEnvironment();

	const char *path = getenv("PATH");
	if (path == nullptr)
		GTEST_SKIP() << "PATH is not set";

	EXPECT_STREQ(ambient.Get("PATH"), path);

	const auto map = ambient.Snapshot();
	const auto i = map.find("PATH");
	ASSERT_NE(i, map.end());
	EXPECT_EQ(i->second, path);
}
