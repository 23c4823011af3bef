// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Content sources which are fed by a thread which blocks while the
 * consumer is not ready.
 */

#pragma once

#include "Source.hxx"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

class EventLoop;
class BlockingChannel;
class SyncReader;

/**
 * Common code for #BlockingOutputSource and #BlockingInputSource.
 * The #ContentSource methods must be called in the #EventLoop
 * thread; the writer methods may be called from any other thread.
 */
class BlockingContentSource : public ContentSource {
	EventLoop &event_loop;

	const std::shared_ptr<BlockingChannel> channel;

	const std::optional<uint_least64_t> length;

	const std::chrono::steady_clock::duration subscribe_timeout;

	bool subscribed = false;

protected:
	/**
	 * Throws #BodyError with #BodyErrorCode::INVALID_LENGTH if the
	 * declared length is negative.
	 *
	 * @param capacity the maximum number of bytes queued between
	 * the writer and the consumer
	 * @param subscribe_timeout how long Write() waits for a
	 * subscription
	 */
	BlockingContentSource(EventLoop &_event_loop,
			      std::optional<int_least64_t> _length,
			      std::size_t capacity,
			      std::chrono::steady_clock::duration _subscribe_timeout);

	~BlockingContentSource() noexcept override;

public:
	/* virtual methods from class ContentPublisher */
	ContentSubscription &Subscribe(ContentHandler &handler) override;

	bool IsReproducible() const noexcept override {
		return false;
	}

	/* virtual methods from class ContentSource */
	std::optional<uint_least64_t> GetLength() const noexcept override {
		return length;
	}

	/**
	 * Block the calling thread until a consumer has subscribed.
	 *
	 * @return true if there is a subscription, false on timeout
	 */
	bool WaitForSubscription(std::chrono::steady_clock::duration timeout) noexcept;

	/**
	 * Fail the subscription with #BodyErrorCode::CANCELLED.  May be
	 * called from any thread.
	 */
	void Cancel() noexcept;

protected:
	void Write(std::span<const std::byte> src);
	void Close() noexcept;
	void Fail(std::exception_ptr ep) noexcept;
};

/**
 * Exposes a synchronous output sink: a producing thread writes data
 * with Write() and finishes with Close().  If a length was declared,
 * writing more than that throws (and fails the subscription), and
 * closing after fewer bytes fails the subscription with
 * #BodyErrorCode::INVALID_LENGTH.
 */
class BlockingOutputSource final : public BlockingContentSource {
public:
	BlockingOutputSource(EventLoop &_event_loop,
			     std::optional<int_least64_t> _length,
			     std::size_t capacity,
			     std::chrono::steady_clock::duration _subscribe_timeout)
		:BlockingContentSource(_event_loop, _length,
				       capacity, _subscribe_timeout) {}

	/**
	 * Hand data to the consumer, blocking while it has not
	 * granted demand.  Throws if the subscription has failed.
	 */
	using BlockingContentSource::Write;

	/**
	 * Signal the end of the data.
	 */
	using BlockingContentSource::Close;
};

/**
 * Pulls data from a #SyncReader in the calling thread and hands it to
 * the consumer, blocking while it has not granted demand.
 */
class BlockingInputSource final : public BlockingContentSource {
	const std::size_t read_buffer_size;

public:
	BlockingInputSource(EventLoop &_event_loop,
			    std::optional<int_least64_t> _length,
			    std::size_t capacity,
			    std::chrono::steady_clock::duration _subscribe_timeout)
		:BlockingContentSource(_event_loop, _length,
				       capacity, _subscribe_timeout),
		 read_buffer_size(capacity) {}

	/**
	 * Copy everything from the reader to the consumer, then close.
	 * If the reader fails, the subscription fails with
	 * #BodyErrorCode::UPSTREAM and the exception is rethrown.
	 *
	 * @return the number of bytes copied
	 */
	uint_least64_t WriteFrom(SyncReader &reader);
};
