// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Subscription.hxx"
#include "Sink.hxx"

/**
 * A #ContentSubscription which forwards demand to another
 * subscription and relays its data, checking every delivery against
 * the protocol.  Subclasses may override the #ContentHandler methods
 * to observe or transform the data.
 */
class ForwardSubscription : public ContentSubscription, protected ContentSink {
protected:
	/**
	 * Throws if subscribing to the upstream fails.
	 */
	ForwardSubscription(EventLoop &event_loop, ContentHandler &_handler,
			    std::optional<uint_least64_t> _expected_length,
			    ContentPublisher &upstream)
		:ContentSubscription(event_loop, _handler, _expected_length),
		 ContentSink(upstream) {}

	/* virtual methods from class ContentSubscription */
	void _OnDemand(uint_least64_t n) noexcept override {
		input.Request(n);
	}

	void _Produce() noexcept override {
		/* unreachable: demand is forwarded by _OnDemand() */
	}

	void _Cancel() noexcept override {
		CancelInput();
		Destroy();
	}

	/* virtual methods from class ContentHandler */
	std::size_t OnContentData(std::span<const std::byte> src) noexcept override {
		return Deliver(src);
	}

	void OnContentEnd() noexcept override {
		ClearInput();
		DestroyEof();
	}

	void OnContentError(std::exception_ptr error) noexcept override {
		ClearInput();
		DestroyError(std::move(error));
	}
};
