// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Handler.hxx"
#include "Pointer.hxx"

/**
 * A #ContentHandler implementation which manages a pointer to its
 * #ContentSubscription.
 */
class ContentSink : protected ContentHandler {
protected:
	SubscriptionPointer input;

	ContentSink() noexcept = default;

	~ContentSink() noexcept {
		input.Cancel();
	}

	/**
	 * Throws if ContentPublisher::Subscribe() fails.
	 */
	explicit ContentSink(ContentPublisher &publisher)
		:input(publisher, *this) {}

	bool HasInput() const noexcept {
		return input.IsDefined();
	}

	void SetInput(ContentPublisher &publisher) {
		input.Set(publisher, *this);
	}

	void ClearInput() noexcept {
		input.Clear();
	}

	void CancelInput() noexcept {
		input.Cancel();
	}
};
