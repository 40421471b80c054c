// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FakeAmbient.hxx"
#include "launch/ConfigParser.hxx"
#include "io/config/LineParser.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <string>
#include <system_error>
#include <vector>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

static const FakeAmbientEnvironment ambient{
	{"PATH", "/bin"},
	{"HOME", "/root"},
};

static void
ParseConfigLines(ConfigParser &parser, const char *const*lines)
{
	while (*lines != nullptr) {
		std::string line{*lines++};
		ParseConfigLine(parser, line.data());
	}

	parser.Finish();
}

TEST(LaunchConfigParser, Basic)
{
	static constexpr const char *input[] = {
		"# test",
		"program /bin/echo",
		"arg hello",
		"arg \"hello world\"",
		"arg ''",
		"setenv FOO bar",
		"setenv EMPTY ''",
		"unsetenv HOME",
		"chdir /tmp",
		"stdout null",
		"stderr pipe",
		nullptr
	};

	LaunchConfigParser p{ambient};
	CommentConfigParser c{p};
	ParseConfigLines(c, input);

	ASSERT_TRUE(p.HasCommand());
	const auto &cmd = p.GetCommand();

	EXPECT_EQ(cmd.GetProgram(), "/bin/echo");

	const std::vector<std::string> expected_args{
		"/bin/echo", "hello", "hello world", "",
	};
	EXPECT_EQ(cmd.GetArgs(), expected_args);

	const EnvironmentMap expected_env{
		{"EMPTY", ""},
		{"FOO", "bar"},
		{"PATH", "/bin"},
	};
	EXPECT_EQ(cmd.GetEffectiveEnvironment(), expected_env);

	EXPECT_STREQ(cmd.GetWorkingDirectory(), "/tmp");
	EXPECT_FALSE(cmd.GetStdin());
	EXPECT_EQ(cmd.GetStdout(), Stdio::Null());
	EXPECT_EQ(cmd.GetStderr(), Stdio::Pipe());
}

TEST(LaunchConfigParser, ClearEnv)
{
	static constexpr const char *input[] = {
		"program env",
		"setenv A 1",
		"clearenv",
		"setenv B 2",
		nullptr
	};

	LaunchConfigParser p{ambient};
	ParseConfigLines(p, input);

	const EnvironmentMap expected{{"B", "2"}};
	EXPECT_EQ(p.GetCommand().GetEffectiveEnvironment(), expected);
}

TEST(LaunchConfigParser, InheritedEnvironment)
{
	static constexpr const char *input[] = {
		"program true",
		nullptr
	};

	LaunchConfigParser p{ambient};
	ParseConfigLines(p, input);

	EXPECT_TRUE(p.GetCommand().GetEnvironment().IsInherited());
}

TEST(LaunchConfigParser, Errors)
{
	{
		/* no program */
		LaunchConfigParser p{ambient};
		EXPECT_THROW(p.Finish(), LineParser::Error);
	}

	{
		LaunchConfigParser p{ambient};
		std::string line{"arg foo"};
		EXPECT_THROW(ParseConfigLine(p, line.data()), std::runtime_error);
	}

	static constexpr const char *bad[] = {
		"program",
		"foo bar",
		"stdin fd",
		"stdin",
		"clearenv now",
		"setenv NAME",
		"chdir a b",
	};

	for (const char *i : bad) {
		LaunchConfigParser p{ambient};
		std::string program{"program /bin/true"};
		ParseConfigLine(p, program.data());

		std::string line{i};
		EXPECT_THROW(ParseConfigLine(p, line.data()), std::runtime_error) << i;
	}

	{
		LaunchConfigParser p{ambient};
		std::string a{"program a"}, b{"program b"};
		ParseConfigLine(p, a.data());
		EXPECT_THROW(ParseConfigLine(p, b.data()), LineParser::Error);
	}
}

TEST(LaunchConfigParser, File)
{
	char path[] = "/tmp/TestLaunchConfigParser.XXXXXX";
	const int fd = mkstemp(path);
	ASSERT_GE(fd, 0);

	static constexpr char contents[] =
		"program /usr/bin/printenv\n"
		"\n"
		"# print one variable\n"
		"arg FOO\n"
		"setenv FOO 'from file'\n";
	ASSERT_EQ(write(fd, contents, sizeof(contents) - 1),
		  ssize_t(sizeof(contents) - 1));
	close(fd);

	LaunchConfigParser p{ambient};
	CommentConfigParser c{p};
	ParseConfigFile(path, c);
	unlink(path);

	const auto &cmd = p.GetCommand();
	EXPECT_EQ(cmd.GetProgram(), "/usr/bin/printenv");
	EXPECT_EQ(cmd.GetArgs().size(), 2U);
	EXPECT_STREQ(cmd.GetEnv("FOO"), "from file");
}

TEST(LaunchConfigParser, FileError)
{
	char path[] = "/tmp/TestLaunchConfigParser.XXXXXX";
	const int fd = mkstemp(path);
	ASSERT_GE(fd, 0);

	static constexpr char contents[] =
		"program /bin/true\n"
		"bogus\n";
	ASSERT_EQ(write(fd, contents, sizeof(contents) - 1),
		  ssize_t(sizeof(contents) - 1));
	close(fd);

	LaunchConfigParser p{ambient};
	CommentConfigParser c{p};

	try {
		ParseConfigFile(path, c);
		unlink(path);
		FAIL() << "Exception expected";
	} catch (...) {
		unlink(path);

		const auto msg = GetFullMessage(std::current_exception());
		EXPECT_NE(msg.find(":2; Unknown directive: 'bogus'"), msg.npos) << msg;
	}
}

TEST(LaunchConfigParser, MissingFile)
{
	LaunchConfigParser p{ambient};
	EXPECT_THROW(ParseConfigFile("/does/not/exist/launch.conf", p),
		     std::system_error);
}
