// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Subscription.hxx"
#include "thread/Job.hxx"

#include <vector>

class ThreadQueue;

/**
 * A #ContentSubscription which performs blocking reads in a worker
 * thread.  One buffer is read per granted demand; the #EventLoop
 * thread never blocks.
 */
class WorkerSubscription : public ContentSubscription, ThreadJob {
	ThreadQueue &queue;

	/**
	 * Filled by ReadInWorker().  Owned by the worker thread while
	 * the job is not idle.
	 */
	std::vector<std::byte> buffer;

	/**
	 * The number of valid bytes in #buffer and the number of
	 * those which were accepted already.
	 */
	std::size_t fill = 0, position = 0;

	/**
	 * The error thrown by ReadInWorker().
	 */
	std::exception_ptr error;

	/**
	 * Has ReadInWorker() reported the end of the stream?
	 */
	bool end_of_stream = false;

	/**
	 * Has the job been added to the #ThreadQueue, and Done() not
	 * been invoked yet?  Only accessed in the #EventLoop thread;
	 * while it is set, the worker owns #buffer, #fill, #position,
	 * #error and #end_of_stream.
	 */
	bool busy = false;

	/**
	 * Was this subscription cancelled while the worker was busy?
	 * Then Done() destroys it.
	 */
	bool cancelled = false;

protected:
	WorkerSubscription(EventLoop &event_loop, ContentHandler &_handler,
			   std::optional<uint_least64_t> _expected_length,
			   ThreadQueue &_queue,
			   std::size_t buffer_size) noexcept;

	~WorkerSubscription() noexcept override = default;

	/**
	 * Read the next portion.  This is called in a worker thread.
	 * Throws on error.
	 *
	 * @return the number of bytes read; 0 at end of stream
	 */
	virtual std::size_t ReadInWorker(std::span<std::byte> dest) = 0;

	/**
	 * Classify an exception thrown by ReadInWorker() before it is
	 * reported to the handler.
	 */
	virtual std::exception_ptr WrapError(std::exception_ptr ep) noexcept;

	/**
	 * Does the stream end exactly at the expected length?  If
	 * yes, the end is reported right after the last byte without
	 * another read (and without waiting for more demand).
	 */
	virtual bool IsEndAtExpectedLength() const noexcept {
		return false;
	}

	/* virtual methods from class ContentSubscription */
	void _Produce() noexcept override;
	void _Cancel() noexcept override;

private:
	/* virtual methods from class ThreadJob */
	void Run() noexcept override;
	void Done() noexcept override;
};
