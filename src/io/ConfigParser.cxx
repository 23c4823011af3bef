// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "body/Error.hxx"

#include <memory>

#include <errno.h>
#include <stdio.h>

namespace fs = boost::filesystem;

struct FileCloser {
	void operator()(FILE *file) const noexcept {
		fclose(file);
	}
};

using UniqueFile = std::unique_ptr<FILE, FileCloser>;

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
			std::throw_with_nested(LineParser::Error(path.native() + ':' + std::to_string(i)));
		}

		++i;
	}
}

inline void
IncludeConfigParser::IncludePath(fs::path &&p)
{
	IncludeConfigParser sub(ApplyPath(path, std::move(p)), child);

	UniqueFile file{fopen(sub.path.c_str(), "r")};
	if (!file)
		throw FmtErrno("Failed to open {}", sub.path.native());

	ParseConfigFile(sub.path, file.get(), sub);
}

inline void
IncludeConfigParser::IncludeOptionalPath(fs::path &&p)
{
	IncludeConfigParser sub(ApplyPath(path, std::move(p)), child);

	UniqueFile file{fopen(sub.path.c_str(), "r")};
	if (!file) {
		switch (errno) {
		case ENOENT:
		case ENOTDIR:
			/* silently ignore this error */
			return;

		default:
			throw FmtErrno("Failed to open {}", sub.path.native());
		}
	}

	ParseConfigFile(sub.path, file.get(), sub);
}

void
ParseConfigFile(const fs::path &path, ConfigParser &parser)
{
	UniqueFile file{fopen(path.c_str(), "r")};
	if (!file)
		throw FmtErrno("Failed to open {}", path.native());

	ParseConfigFile(path, file.get(), parser);
	parser.Finish();
}
