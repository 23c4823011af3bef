// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "reqbody/Mimetype.hxx"

#include <boost/filesystem/path.hpp>

#include <chrono>
#include <cstddef>

struct BodyConfig {
	/**
	 * The size of the chunks produced by SplitContent().
	 */
	std::size_t chunk_size = REQBODY_DEFAULT_CHUNK_SIZE;

	/**
	 * The maximum number of bytes a splitter may buffer.
	 */
	std::size_t max_memory = REQBODY_DEFAULT_MAX_MEMORY;

	/**
	 * The size of each read performed by file and stream content
	 * sources, and the capacity of the blocking adapters.
	 */
	std::size_t read_buffer_size = 64 * 1024;

	/**
	 * How long a blocking writer waits for a subscription.
	 */
	std::chrono::steady_clock::duration subscribe_timeout = std::chrono::seconds(10);

	unsigned worker_threads = 4;

	unsigned verbose = 2;

	/**
	 * Throws std::runtime_error if the configuration is not
	 * usable.
	 */
	void Check() const;
};

/**
 * Load the configuration file.  Throws on error.
 */
BodyConfig
LoadBodyConfig(const boost::filesystem::path &path);

/**
 * Apply global settings: the log level and the size of the worker
 * thread pool.  Call this before the thread pool is started.
 */
void
ApplyBodyConfig(const BodyConfig &config) noexcept;
