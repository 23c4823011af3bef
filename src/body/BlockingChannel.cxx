// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BlockingChannel.hxx"
#include "Error.hxx"
#include "event/InjectEvent.hxx"

#include <algorithm>
#include <cassert>

inline void
BlockingChannel::WakeConsumer() noexcept
{
	if (inject != nullptr)
		inject->Schedule();
}

bool
BlockingChannel::WaitForSubscription(std::chrono::steady_clock::duration timeout) noexcept
{
	std::unique_lock lock{mutex};
	cond.wait_for(lock, timeout, [this]{
		return subscribed || consumer_error;
	});

	return subscribed && !consumer_error;
}

void
BlockingChannel::Write(std::span<const std::byte> src,
		       std::chrono::steady_clock::duration subscribe_timeout)
{
	std::unique_lock lock{mutex};

	if (!subscribed &&
	    !cond.wait_for(lock, subscribe_timeout, [this]{
		    return subscribed || consumer_error;
	    }))
		throw std::runtime_error("Timeout waiting for a subscription");

	if (consumer_error)
		std::rethrow_exception(consumer_error);

	if (writer_error)
		std::rethrow_exception(writer_error);

	if (closed)
		throw BodyError(BodyErrorCode::PROTOCOL_VIOLATION,
				"Write after close");

	if (length && src.size() > *length - written) {
		writer_error = std::make_exception_ptr(FmtBodyError(BodyErrorCode::INVALID_LENGTH,
								    "More than the declared {} bytes written",
								    *length));
		WakeConsumer();
		std::rethrow_exception(writer_error);
	}

	written += src.size();

	while (!src.empty()) {
		cond.wait(lock, [this]{
			return consumer_error ||
				(permits > 0 && queued_bytes < capacity);
		});

		if (consumer_error)
			std::rethrow_exception(consumer_error);

		const std::size_t n = std::min(src.size(),
					       capacity - queued_bytes);
		queue.emplace_back(src.begin(), src.begin() + n);
		queued_bytes += n;
		if (permits != UINT_LEAST64_MAX)
			--permits;

		src = src.subspan(n);
		WakeConsumer();
	}
}

void
BlockingChannel::Close() noexcept
{
	const std::scoped_lock lock{mutex};

	if (closed || writer_error)
		return;

	closed = true;
	WakeConsumer();
}

void
BlockingChannel::Fail(std::exception_ptr ep) noexcept
{
	const std::scoped_lock lock{mutex};

	if (closed || writer_error)
		return;

	writer_error = std::move(ep);
	WakeConsumer();
	cond.notify_all();
}

void
BlockingChannel::Attach(InjectEvent &_inject) noexcept
{
	const std::scoped_lock lock{mutex};

	assert(!subscribed);
	assert(inject == nullptr);

	subscribed = true;
	inject = &_inject;
	cond.notify_all();
}

void
BlockingChannel::Detach(std::exception_ptr reason) noexcept
{
	const std::scoped_lock lock{mutex};

	inject = nullptr;

	if (!consumer_error)
		consumer_error = reason
			? std::move(reason)
			: std::make_exception_ptr(BodyError(BodyErrorCode::CANCELLED,
							    "Content has been consumed completely"));

	queue.clear();
	queued_bytes = 0;
	cond.notify_all();
}

void
BlockingChannel::Grant(uint_least64_t n) noexcept
{
	const std::scoped_lock lock{mutex};

	if (n >= UINT_LEAST64_MAX - permits)
		permits = UINT_LEAST64_MAX;
	else
		permits += n;

	cond.notify_all();
}

BlockingChannel::PopResult
BlockingChannel::Pop(std::vector<std::byte> &dest,
		     std::exception_ptr &error) noexcept
{
	const std::scoped_lock lock{mutex};

	if (writer_error) {
		error = writer_error;
		return PopResult::ERROR;
	}

	if (queue.empty())
		return closed ? PopResult::END : PopResult::EMPTY;

	dest = std::move(queue.front());
	queue.pop_front();
	return PopResult::DATA;
}

void
BlockingChannel::Consumed(std::size_t nbytes) noexcept
{
	const std::scoped_lock lock{mutex};

	assert(nbytes <= queued_bytes);
	queued_bytes -= nbytes;
	cond.notify_all();
}
