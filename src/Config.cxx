// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "io/ConfigParser.hxx"
#include "io/LineParser.hxx"
#include "body/Split.hxx"
#include "thread/Pool.hxx"
#include "Logger.hxx"

#include <fmt/format.h>

#include <limits>

#include <string.h>
#include <stdlib.h>

class BodyConfigParser final : public ConfigParser {
	BodyConfig &config;

public:
	explicit BodyConfigParser(BodyConfig &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

/**
 * Parse a byte count with an optional binary suffix ("k", "M", "G").
 */
static std::size_t
ParseSize(const char *s)
{
	char *endptr;
	unsigned long long value = strtoull(s, &endptr, 10);
	if (endptr == s || *s == '-')
		throw LineParser::Error("Number expected");

	unsigned shift = 0;
	switch (*endptr) {
	case 0:
		break;

	case 'k':
		shift = 10;
		++endptr;
		break;

	case 'M':
		shift = 20;
		++endptr;
		break;

	case 'G':
		shift = 30;
		++endptr;
		break;

	default:
		throw LineParser::Error(fmt::format("Unknown size suffix: {}", endptr));
	}

	if (*endptr != 0)
		throw LineParser::Error(fmt::format("Garbage after size: {}", endptr));

	if (value > (std::numeric_limits<std::size_t>::max() >> shift))
		throw LineParser::Error("Size is too large");

	return std::size_t(value) << shift;
}

static unsigned
ParsePositiveInteger(const char *s)
{
	char *endptr;
	unsigned long value = strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0 || *s == '-')
		throw LineParser::Error("Number expected");

	if (value == 0)
		throw LineParser::Error("Number must be positive");

	if (value > std::numeric_limits<unsigned>::max())
		throw LineParser::Error("Number is too large");

	return value;
}

void
BodyConfigParser::ParseLine(LineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "chunk_size") == 0) {
		config.chunk_size = ParseSize(line.ExpectValueAndEnd());
	} else if (strcmp(word, "max_memory") == 0) {
		config.max_memory = ParseSize(line.ExpectValueAndEnd());
	} else if (strcmp(word, "read_buffer_size") == 0) {
		config.read_buffer_size = ParseSize(line.ExpectValueAndEnd());
	} else if (strcmp(word, "subscribe_timeout") == 0) {
		config.subscribe_timeout =
			std::chrono::seconds(ParsePositiveInteger(line.ExpectValueAndEnd()));
	} else if (strcmp(word, "worker_threads") == 0) {
		config.worker_threads = ParsePositiveInteger(line.ExpectValueAndEnd());
	} else if (strcmp(word, "verbose") == 0) {
		config.verbose = ParsePositiveInteger(line.ExpectValueAndEnd());
	} else
		throw LineParser::Error(fmt::format("Unknown option: {}", word));
}

void
BodyConfigParser::Finish()
{
	config.Check();
}

void
BodyConfig::Check() const
{
	/* the strictest case: the length is not known */
	CheckSplitParameters(chunk_size, max_memory, false);

	if (read_buffer_size == 0)
		throw std::runtime_error("read_buffer_size must be positive");

	if (worker_threads == 0)
		throw std::runtime_error("worker_threads must be positive");
}

BodyConfig
LoadBodyConfig(const boost::filesystem::path &path)
{
	BodyConfig config;
	BodyConfigParser parser(config);
	CommentConfigParser parser2(parser);
	IncludeConfigParser parser3(boost::filesystem::path(path), parser2);

	ParseConfigFile(path, parser3);
	return config;
}

void
ApplyBodyConfig(const BodyConfig &config) noexcept
{
	SetLogLevel(config.verbose);
	thread_pool_set_size(config.worker_threads);
}
