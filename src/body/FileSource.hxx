// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Source.hxx"

#include <cstddef>

class EventLoop;
class ThreadQueue;

/**
 * Deliver the contents of a regular file.  The file is examined
 * with stat() right away; each subscription opens and reads it in a
 * worker thread.  If the file was modified in the meantime, the
 * subscription fails with #BodyErrorCode::UPSTREAM.
 *
 * Throws std::system_error if the file cannot be examined and
 * #BodyError if it is not a regular file.
 *
 * @param read_buffer_size the size of each read
 */
ContentSourcePtr
NewFileContentSource(EventLoop &event_loop, ThreadQueue &queue,
		     const char *path, std::size_t read_buffer_size);

/**
 * Deliver a range of a regular file.
 *
 * Throws #BodyError with #BodyErrorCode::INVALID_ARGUMENT if the
 * range does not fit into the file.
 */
ContentSourcePtr
NewFileContentSource(EventLoop &event_loop, ThreadQueue &queue,
		     const char *path,
		     uint_least64_t offset, uint_least64_t length,
		     std::size_t read_buffer_size);
