// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "WorkerSubscription.hxx"
#include "Error.hxx"
#include "thread/Queue.hxx"

#include <algorithm>

WorkerSubscription::WorkerSubscription(EventLoop &event_loop,
				       ContentHandler &_handler,
				       std::optional<uint_least64_t> _expected_length,
				       ThreadQueue &_queue,
				       std::size_t buffer_size) noexcept
	:ContentSubscription(event_loop, _handler, _expected_length),
	 queue(_queue),
	 buffer(_expected_length
		? std::max<std::size_t>(std::min<uint_least64_t>(buffer_size,
								 *_expected_length),
					1)
		: buffer_size)
{
}

std::exception_ptr
WorkerSubscription::WrapError(std::exception_ptr ep) noexcept
{
	return NestUpstreamError(std::move(ep), "Failed to read content");
}

void
WorkerSubscription::_Produce() noexcept
{
	if (busy)
		/* Done() will continue */
		return;

	if (position < fill) {
		if (!HasDemand())
			return;

		const std::size_t nbytes =
			Deliver({buffer.data() + position, fill - position});
		if (nbytes == 0)
			return;

		position += nbytes;
		if (position < fill)
			/* the handler is full; wait for more demand */
			return;
	}

	if (end_of_stream ||
	    (IsEndAtExpectedLength() && GetRemaining() == 0)) {
		DestroyEof();
		return;
	}

	if (HasDemand()) {
		busy = true;
		thread_queue_add(queue, *this);
	}
}

void
WorkerSubscription::_Cancel() noexcept
{
	if (thread_queue_cancel(queue, *this))
		Destroy();
	else
		/* the worker is busy; we can't destroy this object
		   now, so let Done() do it */
		cancelled = true;
}

void
WorkerSubscription::Run() noexcept
{
	fill = position = 0;

	try {
		fill = ReadInWorker(buffer);
		if (fill == 0)
			end_of_stream = true;
	} catch (...) {
		error = std::current_exception();
	}
}

void
WorkerSubscription::Done() noexcept
{
	busy = false;

	if (cancelled) {
		Destroy();
		return;
	}

	if (error) {
		DestroyError(WrapError(std::move(error)));
		return;
	}

	_Produce();
}
