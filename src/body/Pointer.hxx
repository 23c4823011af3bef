// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Source.hxx"
#include "Subscription.hxx"

#include <cassert>
#include <utility>

/**
 * A pointer to a #ContentSubscription owned by a #ContentHandler.
 */
class SubscriptionPointer {
	ContentSubscription *subscription = nullptr;

public:
	SubscriptionPointer() = default;

	/**
	 * Throws if ContentPublisher::Subscribe() fails.
	 */
	SubscriptionPointer(ContentPublisher &publisher,
			    ContentHandler &handler)
		:subscription(&publisher.Subscribe(handler)) {}

	SubscriptionPointer(SubscriptionPointer &&other) noexcept
		:subscription(std::exchange(other.subscription, nullptr)) {}

	SubscriptionPointer(const SubscriptionPointer &) = delete;
	SubscriptionPointer &operator=(const SubscriptionPointer &) = delete;

	[[gnu::always_inline]]
	bool IsDefined() const noexcept {
		return subscription != nullptr;
	}

	/**
	 * Forget the subscription without cancelling it.  Call this
	 * after the subscription has finished.
	 */
	[[gnu::always_inline]]
	void Clear() noexcept {
		subscription = nullptr;
	}

	/**
	 * Throws if ContentPublisher::Subscribe() fails.
	 */
	void Set(ContentPublisher &publisher, ContentHandler &handler) {
		assert(!IsDefined());

		subscription = &publisher.Subscribe(handler);
	}

	void Request(uint_least64_t n) noexcept {
		assert(IsDefined());

		subscription->Request(n);
	}

	/**
	 * Cancel the subscription.  Does nothing if there is none.
	 */
	void Cancel() noexcept {
		if (auto *old = std::exchange(subscription, nullptr))
			old->Cancel();
	}
};
