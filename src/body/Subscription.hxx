// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/DeferEvent.hxx"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <span>

class EventLoop;
class ContentHandler;

/**
 * One production session of a #ContentSource, bound to one
 * #ContentHandler.  The consumer grants demand with Request(); each
 * delivery consumes one unit of it.
 *
 * The lifetime of a #ContentSubscription begins with
 * ContentPublisher::Subscribe() and ends with one of the following
 * events:
 *
 * - it is cancelled with Cancel()
 * - all data has been delivered (ContentHandler::OnContentEnd())
 * - an error has occurred (ContentHandler::OnContentError())
 *
 * A subscription does not depend on the lifetime of the
 * #ContentSource which created it.
 *
 * All methods must be called from the #EventLoop thread.
 */
class ContentSubscription {
	ContentHandler &handler;

	/**
	 * Runs _Produce() (or reports #pending_error) from the
	 * #EventLoop, so production never happens inside the
	 * consumer's Request() call.
	 */
	DeferEvent defer_produce;

	/**
	 * An error which was detected inside a consumer call and will
	 * be reported by #defer_produce.
	 */
	std::exception_ptr pending_error;

	/**
	 * The number of deliveries the consumer is willing to receive.
	 * #UNBOUNDED_DEMAND means there is no limit.
	 */
	uint_least64_t demand = 0;

	/**
	 * The number of bytes accepted by the handler so far.
	 */
	uint_least64_t delivered = 0;

	const std::optional<uint_least64_t> expected_length;

#ifndef NDEBUG
	bool destroyed = false;
#endif

public:
	static constexpr uint_least64_t UNBOUNDED_DEMAND = UINT_LEAST64_MAX;

protected:
	ContentSubscription(EventLoop &event_loop, ContentHandler &_handler,
			    std::optional<uint_least64_t> _expected_length) noexcept;

	virtual ~ContentSubscription() noexcept;

	ContentSubscription(const ContentSubscription &) = delete;
	ContentSubscription &operator=(const ContentSubscription &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return defer_produce.GetEventLoop();
	}

	bool HasDemand() const noexcept {
		return demand > 0;
	}

	uint_least64_t GetDemand() const noexcept {
		return demand;
	}

	uint_least64_t GetDelivered() const noexcept {
		return delivered;
	}

	const std::optional<uint_least64_t> &GetExpectedLength() const noexcept {
		return expected_length;
	}

	/**
	 * How many more bytes may be delivered?  Returns
	 * UINT_LEAST64_MAX if the length is unknown.
	 */
	[[gnu::pure]]
	uint_least64_t GetRemaining() const noexcept {
		return expected_length
			? *expected_length - delivered
			: UINT_LEAST64_MAX;
	}

	/**
	 * Schedule a _Produce() call in the next #EventLoop
	 * iteration.
	 */
	void ScheduleProduce() noexcept {
		defer_produce.Schedule();
	}

	/**
	 * Pass data to the handler.  Fails the session with
	 * #BodyErrorCode::PROTOCOL_VIOLATION if there is no demand and
	 * with #BodyErrorCode::INVALID_LENGTH if the data exceeds the
	 * expected length.
	 *
	 * If this method returns 0, this object may have been
	 * destroyed; the caller must return immediately without
	 * touching any attribute.
	 *
	 * @return the number of bytes accepted by the handler
	 */
	std::size_t Deliver(std::span<const std::byte> src) noexcept;

	void Destroy() noexcept {
		delete this;
	}

	/**
	 * Destroy this object and invoke ContentHandler::OnContentEnd()
	 * (or OnContentError() if fewer bytes than the expected
	 * length have been delivered).
	 */
	void DestroyEof() noexcept;

	void DestroyError(std::exception_ptr ep) noexcept;

	/**
	 * The consumer has granted more demand.  The default
	 * implementation schedules _Produce().
	 */
	virtual void _OnDemand([[maybe_unused]] uint_least64_t n) noexcept {
		ScheduleProduce();
	}

	/**
	 * Deliver as much data as the current demand allows, and
	 * finish the session if the end has been reached.  Called
	 * from the #EventLoop, never from inside a consumer call.
	 */
	virtual void _Produce() noexcept = 0;

	/**
	 * Stop production and release all resources.  The default
	 * implementation destroys this object.
	 */
	virtual void _Cancel() noexcept {
		Destroy();
	}

public:
	/**
	 * Grant demand for @n more deliveries.  Demand accumulates
	 * and saturates at #UNBOUNDED_DEMAND.  A zero value is a
	 * protocol violation which fails the session.
	 */
	void Request(uint_least64_t n) noexcept;

	/**
	 * Stop production.  No further handler method will be invoked
	 * and this object is destroyed.
	 */
	void Cancel() noexcept {
		assert(!destroyed);

		defer_produce.Cancel();
		_Cancel();
	}

private:
	void OnDeferredProduce() noexcept;
};
