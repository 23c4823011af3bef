// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Source.hxx"
#include "Sink.hxx"
#include "event/DeferEvent.hxx"
#include "Logger.hxx"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <deque>
#include <optional>

class EventLoop;
struct SplitChunk;

/**
 * Receives the chunks of a #ContentSplitter.  Exactly one of
 * OnChunksEnd() and OnChunksError() is invoked after the last
 * chunk.
 */
class ChunkHandler {
public:
	/**
	 * The next chunk is available.  It is a single-use
	 * #ContentSource with a known length.  Destroying it without
	 * consuming it completely fails the split.
	 *
	 * @param offset the position of the chunk within the parent
	 */
	virtual void OnChunk(ContentSourcePtr chunk,
			     uint_least64_t offset) noexcept = 0;

	virtual void OnChunksEnd() noexcept = 0;
	virtual void OnChunksError(std::exception_ptr error) noexcept = 0;
};

/**
 * Learns when a split operation is finished.
 */
class SplitCompletionHandler {
public:
	/**
	 * All chunks have been emitted and consumed completely.  The
	 * parent #ContentSource is not used anymore.
	 */
	virtual void OnSplitComplete() noexcept = 0;

	virtual void OnSplitError(std::exception_ptr error) noexcept = 0;
};

/**
 * Subdivides one #ContentSource (the "parent") into an ordered
 * sequence of chunk sources of at most #chunk_size bytes each, with
 * only the last one being smaller.  The parent is subscribed to once,
 * upon the first chunk request.  The number of bytes accepted from
 * the parent but not yet consumed through a chunk never exceeds
 * #memory_ceiling.
 *
 * If the parent's length is known, each chunk is emitted as soon as
 * it is requested, and its data streams through when the parent
 * delivers it.  Otherwise, a chunk is emitted when it has been filled
 * completely (or when the parent has ended).
 *
 * All methods must be called in the #EventLoop thread.  All handler
 * methods are invoked from the #EventLoop; they may destroy this
 * object.
 */
class ContentSplitter final : ContentSink {
	EventLoop &event_loop;

	ContentSource &parent;

	const std::size_t chunk_size, memory_ceiling;

	/**
	 * The parent's length, if known.
	 */
	const std::optional<uint_least64_t> length;

	const LLogger logger;

	/**
	 * Emits chunks and reports the end of the chunk stream.
	 */
	DeferEvent defer_emit;

	/**
	 * Reports the result to the #SplitCompletionHandler.
	 */
	DeferEvent defer_complete;

	ChunkHandler *chunk_handler = nullptr;
	SplitCompletionHandler *completion_handler = nullptr;

	/**
	 * The chunks which are still referenced by this object, in
	 * order: from the oldest one which has not been consumed
	 * completely to the newest one.  Finished chunks are removed
	 * from the front, so this does not grow with the parent's
	 * length.
	 */
	std::deque<std::shared_ptr<SplitChunk>> chunks;

	/**
	 * The number of chunks which have been removed from the front
	 * of #chunks, i.e. the index of chunks.front().  All other
	 * chunk indices below are absolute, too.
	 */
	uint_least64_t n_removed = 0;

	/**
	 * The number of chunks which have been created.
	 */
	uint_least64_t n_created = 0;

	/**
	 * The number of chunks requested by the #ChunkHandler and not
	 * yet emitted.
	 */
	uint_least64_t chunk_demand = 0;

	/**
	 * The number of chunks which have been emitted.
	 */
	uint_least64_t n_emitted = 0;

	/**
	 * The index of the chunk which receives the next byte from the
	 * parent.  All chunks before it are sealed.
	 */
	uint_least64_t intake_index = 0;

	/**
	 * The number of emitted chunks which have not been consumed
	 * completely yet.
	 */
	std::size_t n_outstanding = 0;

	/**
	 * The number of bytes accepted from the parent.
	 */
	uint_least64_t intake_offset = 0;

	/**
	 * The parent offset of the next chunk to be emitted.
	 */
	uint_least64_t next_chunk_offset = 0;

	/**
	 * The number of bytes accepted from the parent and not yet
	 * consumed through a chunk.
	 */
	std::size_t buffered_bytes = 0;

	std::exception_ptr error;

	bool chunk_subscribed = false;

	bool parent_started = false, parent_requested = false;

	bool parent_end = false;

	/**
	 * Has OnChunksEnd() or OnChunksError() been invoked (or will
	 * never be, because the chunk consumer has cancelled)?
	 */
	bool chunks_end = false;

	bool failed = false, completion_notified = false;

public:
	/**
	 * Use SplitContent() to create instances.
	 */
	ContentSplitter(EventLoop &_event_loop, ContentSource &_parent,
			std::size_t _chunk_size,
			std::size_t _memory_ceiling) noexcept;

	~ContentSplitter() noexcept;

	ContentSplitter(const ContentSplitter &) = delete;
	ContentSplitter &operator=(const ContentSplitter &) = delete;

	/**
	 * Register the chunk consumer.  Nothing is emitted before it
	 * calls Request().
	 *
	 * Throws #BodyError with #BodyErrorCode::NOT_REPRODUCIBLE if a
	 * consumer was registered already.
	 */
	void Subscribe(ChunkHandler &handler);

	/**
	 * Grant demand for @n more chunks.  The first call subscribes
	 * to the parent.  A zero value is a protocol violation which
	 * fails the split.
	 */
	void Request(uint_least64_t n) noexcept;

	/**
	 * The chunk consumer is not interested anymore.  The parent
	 * subscription is cancelled and the split fails with
	 * #BodyErrorCode::CANCELLED; chunks which have been received
	 * completely remain valid.  No further #ChunkHandler method is
	 * invoked.
	 */
	void Cancel() noexcept;

	/**
	 * Register the completion handler.  If the result is known
	 * already, it is reported in the next #EventLoop iteration.
	 */
	void SetCompletionHandler(SplitCompletionHandler &handler) noexcept;

	std::size_t GetBufferedBytes() const noexcept {
		return buffered_bytes;
	}

	/**
	 * The number of chunks this object still keeps track of: from
	 * the oldest one which has not been consumed completely to the
	 * newest one.
	 */
	std::size_t GetTrackedChunkCount() const noexcept {
		return chunks.size();
	}

	std::size_t GetMemoryCeiling() const noexcept {
		return memory_ceiling;
	}

	uint_least64_t GetNextChunkOffset() const noexcept {
		return next_chunk_offset;
	}

	/* called by the chunks */
	void OnChunkConsumed(std::size_t nbytes) noexcept;
	void OnChunkFinished() noexcept;
	void OnChunkAbandoned() noexcept;

private:
	bool IsKnownLength() const noexcept {
		return length.has_value();
	}

	/**
	 * The number of chunks if the length is known.
	 */
	[[gnu::pure]]
	uint_least64_t GetChunkCount() const noexcept {
		return (*length + chunk_size - 1) / chunk_size;
	}

	bool IsComplete() const noexcept {
		return !failed && parent_end && chunks_end &&
			n_outstanding == 0;
	}

	const std::shared_ptr<SplitChunk> &GetChunk(uint_least64_t i) const noexcept {
		return chunks[i - n_removed];
	}

	SplitChunk &MakeChunk() noexcept;

	/**
	 * Drop finished chunks from the front of #chunks.
	 */
	void RemoveFinishedChunks() noexcept;

	/**
	 * Returns the chunk which receives the next byte from the
	 * parent, creating it if necessary.
	 */
	SplitChunk &GetIntakeChunk() noexcept;

	/**
	 * Returns the next chunk which can be emitted, or nullptr if
	 * there is none yet.
	 */
	std::shared_ptr<SplitChunk> GetEmittableChunk() noexcept;

	/**
	 * Have all chunks been emitted and has the parent ended?
	 */
	[[gnu::pure]]
	bool IsChunkStreamFinished() const noexcept;

	void StartParent() noexcept;
	void RequestParent() noexcept;

	/**
	 * Fail the split: cancel the parent, fail all chunks which
	 * have not been received completely, and report the error to
	 * both handlers (from the #EventLoop).
	 */
	void Fail(std::exception_ptr ep) noexcept;

	void OnDeferredEmit() noexcept;
	void OnDeferredComplete() noexcept;

	/* virtual methods from class ContentHandler */
	std::size_t OnContentData(std::span<const std::byte> src) noexcept override;
	void OnContentEnd() noexcept override;
	void OnContentError(std::exception_ptr ep) noexcept override;
};

/**
 * Validate split parameters.  Throws #BodyError with
 * #BodyErrorCode::INVALID_ARGUMENT if a size is zero or if the length
 * is unknown and the memory ceiling is smaller than the chunk size
 * (a whole chunk needs to be buffered before it can be emitted).
 */
void
CheckSplitParameters(std::size_t chunk_size, std::size_t memory_ceiling,
		     bool length_known);

/**
 * Split a #ContentSource into chunks.  The parent is not touched
 * before the first ContentSplitter::Request() call, and it must
 * remain valid until then.
 *
 * Throws #BodyError with #BodyErrorCode::INVALID_ARGUMENT (see
 * CheckSplitParameters()).
 */
std::unique_ptr<ContentSplitter>
SplitContent(EventLoop &event_loop, ContentSource &parent,
	     std::size_t chunk_size, std::size_t memory_ceiling);
