// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "util/ScopeExit.hxx"

#include <fmt/core.h>

#include <system_error>

#include <errno.h>
#include <stdio.h>

namespace fs = boost::filesystem;

bool
ConfigParser::PreParseLine([[maybe_unused]] LineParser &line)
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

bool
IncludeConfigParser::PreParseLine(LineParser &line)
{
	return child.PreParseLine(line);
}

void
IncludeConfigParser::ParseLine(LineParser &line)
{
	if (line.SkipWord("@include")) {
		const char *p = line.NextUnescape();
		if (p == nullptr)
			throw LineParser::Error("Quoted path expected");

		line.ExpectEnd();

		IncludePath(p);
	} else if (line.SkipWord("@include_optional")) {
		const char *p = line.NextUnescape();
		if (p == nullptr)
			throw LineParser::Error("Quoted path expected");

		line.ExpectEnd();

		IncludeOptionalPath(p);
	} else
		child.ParseLine(line);
}

void
IncludeConfigParser::Finish()
{
	child.Finish();
}

static fs::path
ApplyPath(const fs::path &base, fs::path &&p)
{
	if (p.is_absolute())
		/* is already absolute */
		return p;

	return base.parent_path() / p;
}

[[noreturn]]
static void
ThrowOpenError(int e, const fs::path &path)
{
	throw std::system_error(e, std::system_category(),
				fmt::format("Failed to open {}",
					    path.string()));
}

static void
ParseConfigFile(const fs::path &path, FILE *file, ConfigParser &parser)
{
	char buffer[4096], *line;
	unsigned i = 1;
	while ((line = fgets(buffer, sizeof(buffer), file)) != nullptr) {
		LineParser line_parser(line);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error(path.string() + ':' + std::to_string(i)));
		}

		++i;
	}
}

inline void
IncludeConfigParser::IncludePath(fs::path &&p)
{
	p = ApplyPath(path, std::move(p));

	FILE *file = fopen(p.c_str(), "r");
	if (file == nullptr)
		ThrowOpenError(errno, p);

	AtScopeExit(file) { fclose(file); };

	IncludeConfigParser sub(std::move(p), child);
	/* no Finish() here: the included file shares the state of
	   the including file */
	ParseConfigFile(sub.path, file, sub);
}

inline void
IncludeConfigParser::IncludeOptionalPath(fs::path &&p)
{
	p = ApplyPath(path, std::move(p));

	FILE *file = fopen(p.c_str(), "r");
	if (file == nullptr) {
		const int e = errno;
		switch (e) {
		case ENOENT:
		case ENOTDIR:
			/* silently ignore this error */
			return;

		default:
			ThrowOpenError(e, p);
		}
	}

	AtScopeExit(file) { fclose(file); };

	IncludeConfigParser sub(std::move(p), child);
	/* no Finish() here: the included file shares the state of
	   the including file */
	ParseConfigFile(sub.path, file, sub);
}

void
ParseConfigFile(const fs::path &path, ConfigParser &parser)
{
	FILE *file = fopen(path.c_str(), "r");
	if (file == nullptr)
		ThrowOpenError(errno, path);

	AtScopeExit(file) { fclose(file); };

	ParseConfigFile(path, file, parser);
	parser.Finish();
}
