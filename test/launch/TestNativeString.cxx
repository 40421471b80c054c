// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "launch/NativeString.hxx"
#include "launch/Error.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(NativeString, Valid)
{
	EXPECT_EQ(ToNativeString("foo"), "foo");
	EXPECT_EQ(ToNativeString(""), "");
	EXPECT_EQ(ToNativeString("\xff\xfe"), "\xff\xfe");
	EXPECT_NO_THROW(CheckNativeString("a b c"));
}

TEST(NativeString, NullByte)
{
	try {
		(void)ToNativeString("abc\0def"sv);
		FAIL() << "StringConversionError expected";
	} catch (const StringConversionError &e) {
		EXPECT_EQ(e.GetPosition(), 3U);
	}

	EXPECT_THROW(CheckNativeString("\0"sv), StringConversionError);

	/* StringConversionError is a std::invalid_argument */
	EXPECT_THROW(CheckNativeString("x\0"sv), std::invalid_argument);
}
