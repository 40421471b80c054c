// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <filesystem>

class LineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	virtual bool PreParseLine(LineParser &line);
	virtual void ParseLine(LineParser &line) = 0;
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child)
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) final;
	void Finish() override;
};

/**
 * Feed one line to the parser.  The buffer is modified.
 */
void
ParseConfigLine(ConfigParser &parser, char *line);

/**
 * Parse all lines of the specified file and then call
 * ConfigParser::Finish().  Errors are wrapped in a
 * #LineParser::Error which contains the file name and the line
 * number.
 *
 * Throws on error.
 */
void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser);
