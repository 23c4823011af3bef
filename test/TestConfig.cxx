// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempFile.hxx"
#include "Config.hxx"
#include "Logger.hxx"
#include "body/Error.hxx"

#include <gtest/gtest.h>

#include <boost/filesystem/path.hpp>

using namespace std::chrono_literals;

TEST(Config, Defaults)
{
	const BodyConfig config;
	EXPECT_EQ(config.chunk_size, 8U * 1024 * 1024);
	EXPECT_EQ(config.max_memory, 32U * 1024 * 1024);
	EXPECT_EQ(config.subscribe_timeout, std::chrono::steady_clock::duration(10s));
	EXPECT_NO_THROW(config.Check());
}

TEST(Config, Load)
{
	const TempFile file("# comment\n"
			    "\n"
			    "chunk_size 4M\n"
			    "  max_memory 16M  \n"
			    "read_buffer_size 128k\n"
			    "subscribe_timeout 30\n"
			    "worker_threads 8\n"
			    "verbose 3\n");

	const auto config = LoadBodyConfig(file.GetPath());
	EXPECT_EQ(config.chunk_size, 4U * 1024 * 1024);
	EXPECT_EQ(config.max_memory, 16U * 1024 * 1024);
	EXPECT_EQ(config.read_buffer_size, 128U * 1024);
	EXPECT_EQ(config.subscribe_timeout, std::chrono::steady_clock::duration(30s));
	EXPECT_EQ(config.worker_threads, 8U);
	EXPECT_EQ(config.verbose, 3U);
}

TEST(Config, Include)
{
	const TempFile included("chunk_size 1k\n"
				"max_memory 1G\n");

	const TempFile file("@include \"" + included.GetPath() + "\"\n"
			    "@include_optional \"/does/not/exist.conf\"\n"
			    "worker_threads 2\n");

	const auto config = LoadBodyConfig(file.GetPath());
	EXPECT_EQ(config.chunk_size, 1024U);
	EXPECT_EQ(config.max_memory, 1024U * 1024 * 1024);
	EXPECT_EQ(config.worker_threads, 2U);
}

TEST(Config, UnknownOption)
{
	const TempFile file("chunk_size 1M\n"
			    "foo bar\n");

	try {
		LoadBodyConfig(file.GetPath());
		FAIL();
	} catch (const std::exception &e) {
		/* the error message contains the location, the nested
		   exception the reason */
		EXPECT_EQ(std::string(e.what()), file.GetPath() + ":2");
		EXPECT_EQ(GetFullMessage(std::current_exception()),
			  file.GetPath() + ":2: Unknown option: foo");
	}
}

TEST(Config, BadValues)
{
	const TempFile bad_suffix("chunk_size 4X\n");
	EXPECT_THROW(LoadBodyConfig(bad_suffix.GetPath()), std::runtime_error);

	const TempFile zero_threads("worker_threads 0\n");
	EXPECT_THROW(LoadBodyConfig(zero_threads.GetPath()), std::runtime_error);

	const TempFile missing_value("verbose\n");
	EXPECT_THROW(LoadBodyConfig(missing_value.GetPath()), std::runtime_error);
}

/**
 * The memory ceiling must not be smaller than the chunk size.
 */
TEST(Config, Check)
{
	const TempFile file("chunk_size 1M\n"
			    "max_memory 64k\n");

	try {
		LoadBodyConfig(file.GetPath());
		FAIL();
	} catch (const BodyError &e) {
		EXPECT_EQ(e.GetCode(), BodyErrorCode::INVALID_ARGUMENT);
	}

	BodyConfig config;
	config.read_buffer_size = 0;
	EXPECT_THROW(config.Check(), std::runtime_error);
}

TEST(Config, MissingFile)
{
	EXPECT_THROW(LoadBodyConfig("/does/not/exist.conf"), std::system_error);
}

TEST(Config, Apply)
{
	BodyConfig config;
	config.verbose = 5;
	ApplyBodyConfig(config);
	EXPECT_EQ(GetLogLevel(), 5U);
	EXPECT_TRUE(IsLogLevelVisible(5));

	config.verbose = 1;
	ApplyBodyConfig(config);
	EXPECT_FALSE(IsLogLevelVisible(2));
}
