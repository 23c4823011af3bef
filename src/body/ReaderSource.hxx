// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Source.hxx"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

class EventLoop;
class ThreadQueue;
class SyncReader;

/**
 * Deliver data from a #SyncReader.  Demand drives reads in a worker
 * thread of the given #ThreadQueue.  The source can be subscribed to
 * only once.
 *
 * Throws #BodyError with #BodyErrorCode::INVALID_LENGTH if the
 * declared length is negative.
 *
 * @param length the declared length (std::nullopt if unknown); if
 * the reader produces a different number of bytes, the subscription
 * fails with #BodyErrorCode::INVALID_LENGTH
 */
ContentSourcePtr
NewReaderContentSource(EventLoop &event_loop, ThreadQueue &queue,
		       std::unique_ptr<SyncReader> reader,
		       std::optional<int_least64_t> length,
		       std::size_t read_buffer_size);

/**
 * Convert a caller-declared length to an unsigned one.  Throws
 * #BodyError with #BodyErrorCode::INVALID_LENGTH if it is negative.
 */
std::optional<uint_least64_t>
CheckDeclaredLength(std::optional<int_least64_t> length);
