// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

class InjectEvent;

/**
 * A bounded handoff between a thread which writes synchronously and
 * the #ContentSubscription which delivers the data in the
 * #EventLoop thread.  The writer blocks while the consumer has not
 * granted demand or while #capacity bytes are queued.
 *
 * All methods are thread-safe.
 */
class BlockingChannel {
	std::mutex mutex;

	/**
	 * Wakes up the writer.
	 */
	std::condition_variable cond;

	/**
	 * Wakes up the consumer in the #EventLoop thread; nullptr
	 * while there is no subscription.
	 */
	InjectEvent *inject = nullptr;

	/**
	 * Data which has not been accepted by the consumer yet.
	 */
	std::deque<std::vector<std::byte>> queue;

	/**
	 * The number of bytes in #queue plus the bytes being
	 * delivered by the consumer.
	 */
	std::size_t queued_bytes = 0;

	const std::size_t capacity;

	/**
	 * The number of writes the writer may enqueue; this mirrors
	 * the consumer's demand.
	 */
	uint_least64_t permits = 0;

	/**
	 * The number of bytes passed to Write() so far.
	 */
	uint_least64_t written = 0;

	const std::optional<uint_least64_t> length;

	bool subscribed = false;

	/**
	 * Has the writer called Close()?
	 */
	bool closed = false;

	/**
	 * The writer has failed or cancelled; the consumer fails with
	 * this error.
	 */
	std::exception_ptr writer_error;

	/**
	 * The consumer is gone; the writer's next call throws this
	 * error.
	 */
	std::exception_ptr consumer_error;

public:
	BlockingChannel(std::size_t _capacity,
			std::optional<uint_least64_t> _length) noexcept
		:capacity(_capacity), length(_length) {}

	BlockingChannel(const BlockingChannel &) = delete;
	BlockingChannel &operator=(const BlockingChannel &) = delete;

	/* writer side */

	/**
	 * Wait until a consumer has subscribed.
	 *
	 * @return true if there is a subscription, false on timeout or
	 * if the consumer is already gone
	 */
	bool WaitForSubscription(std::chrono::steady_clock::duration timeout) noexcept;

	/**
	 * Enqueue a copy of the data, blocking until the consumer has
	 * granted demand and there is room.  Waits at most
	 * @subscribe_timeout for a subscription.
	 *
	 * Throws #BodyError with #BodyErrorCode::INVALID_LENGTH if more
	 * data is written than declared (this fails the subscription,
	 * too), with #BodyErrorCode::CANCELLED if the consumer has
	 * cancelled, or the consumer's error.
	 */
	void Write(std::span<const std::byte> src,
		   std::chrono::steady_clock::duration subscribe_timeout);

	/**
	 * The writer has finished.  Does nothing if the channel has
	 * already failed.
	 */
	void Close() noexcept;

	/**
	 * Fail the subscription with the given error.  Does nothing if
	 * the channel has already been closed or failed.
	 */
	void Fail(std::exception_ptr ep) noexcept;

	/* consumer side */

	/**
	 * Register the consumer.  Wakes up a writer waiting in
	 * WaitForSubscription().
	 */
	void Attach(InjectEvent &_inject) noexcept;

	/**
	 * Unregister the consumer.  After this returns, @inject will
	 * not be used anymore.
	 *
	 * @param reason the error the writer shall receive; nullptr if
	 * the consumer has finished regularly
	 */
	void Detach(std::exception_ptr reason) noexcept;

	/**
	 * The consumer has granted more demand.
	 */
	void Grant(uint_least64_t n) noexcept;

	enum class PopResult {
		/**
		 * A portion was moved to the given buffer.
		 */
		DATA,

		/**
		 * Nothing is queued right now.
		 */
		EMPTY,

		/**
		 * Nothing is queued and the writer has closed the
		 * channel.
		 */
		END,

		/**
		 * The writer has failed; the error was returned.
		 */
		ERROR,
	};

	/**
	 * Take the next portion from the queue.  Its size stays
	 * accounted until Consumed() is called.
	 */
	PopResult Pop(std::vector<std::byte> &dest,
		      std::exception_ptr &error) noexcept;

	/**
	 * The consumer has delivered the given number of bytes which
	 * were obtained with Pop().
	 */
	void Consumed(std::size_t nbytes) noexcept;

private:
	void WakeConsumer() noexcept;
};
