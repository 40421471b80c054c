// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fmt/format.h>

#include <cstddef>
#include <exception>
#include <string>

#include <string.h>

using std::string_view_literals::operator""sv;

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

void
ParseConfigLine(ConfigParser &parser, char *line)
{
	LineParser line_parser(line);
	if (!parser.PreParseLine(line_parser))
		parser.ParseLine(line_parser);
}

static std::string
ReadConfigFile(const std::filesystem::path &path)
{
	const auto fd = OpenReadOnly(path.c_str());

	std::string contents;
	std::byte buffer[4096];

	while (true) {
		const auto nbytes = fd.Read(buffer);
		if (nbytes < 0)
			throw FmtErrno("Failed to read '{}'", path.native());

		if (nbytes == 0)
			break;

		contents.append(reinterpret_cast<const char *>(buffer), nbytes);
	}

	return contents;
}

void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	std::string contents = ReadConfigFile(path);

	char *line = contents.data();
	char *const end = line + contents.size();

	unsigned i = 1;
	while (line < end) {
		char *eol = static_cast<char *>(memchr(line, '\n', end - line));
		if (eol == nullptr)
			eol = end;

		*eol = 0;

		if (memchr(line, 0, eol - line) != nullptr)
			throw LineParser::Error{fmt::format("{}:{}: Null byte in line"sv,
							    path.native(), i)};

		try {
			ParseConfigLine(parser, line);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{fmt::format("{}:{}"sv,
									     path.native(), i)});
		}

		line = eol + 1;
		++i;
	}

	parser.Finish();
}
