// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/UniqueFd.hxx"

#include <cstddef>
#include <span>

/**
 * A synchronous (blocking) byte stream.  Its methods are called in a
 * worker thread or by the thread which owns the reader, never in the
 * #EventLoop thread.
 */
class SyncReader {
public:
	virtual ~SyncReader() noexcept = default;

	/**
	 * Read data into the given buffer, blocking until at least one
	 * byte is available.  Throws on error.
	 *
	 * @return the number of bytes read; 0 at end of stream
	 */
	virtual std::size_t Read(std::span<std::byte> dest) = 0;
};

/**
 * A #SyncReader which reads from a file descriptor, e.g. a pipe.
 */
class FdReader final : public SyncReader {
	UniqueFd fd;

public:
	explicit FdReader(UniqueFd &&_fd) noexcept
		:fd(std::move(_fd)) {}

	std::size_t Read(std::span<std::byte> dest) override {
		return fd.Read(dest);
	}
};
