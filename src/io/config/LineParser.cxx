// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LineParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

void
LineParser::ExpectWhitespace()
{
	if (!IsWhitespaceNotNull(front()))
		throw Error("Syntax error");

	++p;
	Strip();
}

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw FmtRuntimeError("Unexpected tokens at end of line: {}", p);
}

bool
LineParser::SkipWord(const char *word) noexcept
{
	char *q = p;
	while (*word != 0)
		if (*q++ != *word++)
			return false;

	if (*q == 0) {
		p = q;
		return true;
	}

	if (IsWhitespaceNotNull(*q)) {
		p = StripLeft(q + 1);
		return true;
	}

	return false;
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	char *end = p + 1;
	while (IsWordChar(*end))
		++end;

	if (*end != 0 && !IsWhitespaceNotNull(*end))
		return nullptr;

	const char *value = p;
	if (*end == 0) {
		p = end;
	} else {
		*end = 0;
		p = StripLeft(end + 1);
	}

	return value;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	if (!IsUnquotedChar(front()))
		return nullptr;

	char *end = p + 1;
	while (IsUnquotedChar(*end))
		++end;

	if (*end != 0 && !IsWhitespaceNotNull(*end))
		return nullptr;

	char *value = p;
	if (*end == 0) {
		p = end;
	} else {
		*end = 0;
		p = StripLeft(end + 1);
	}

	return value;
}

char *
LineParser::NextUnescape() noexcept
{
	const char stop = front();
	if (!IsQuote(stop))
		return nullptr;

	char *src = p + 1;
	char *const value = src;
	char *dest = src;

	while (true) {
		char ch = *src++;
		if (ch == 0)
			/* missing closing quote */
			return nullptr;

		if (ch == stop)
			break;

		if (ch == '\\' && stop == '"') {
			ch = *src++;
			switch (ch) {
			case 'n':
				ch = '\n';
				break;

			case 'r':
				ch = '\r';
				break;

			case 't':
				ch = '\t';
				break;

			case '"':
			case '\'':
			case '\\':
				break;

			default:
				return nullptr;
			}
		}

		*dest++ = ch;
	}

	if (*src != 0 && !IsWhitespaceNotNull(*src))
		return nullptr;

	*dest = 0;
	p = StripLeft(src);
	return value;
}

char *
LineParser::NextValue() noexcept
{
	if (IsQuote(front()))
		return NextUnescape();
	else
		return NextUnquotedValue();
}

const char *
LineParser::ExpectWord()
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error("Word expected");

	return value;
}

char *
LineParser::ExpectValue()
{
	char *value = NextValue();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}
