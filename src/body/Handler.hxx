// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <exception>
#include <span>

/**
 * The consumer side of a #ContentSubscription.  Exactly one of
 * OnContentEnd() and OnContentError() is invoked, and after that, the
 * subscription is gone; nothing follows.
 */
class ContentHandler {
public:
	/**
	 * Data is available.  Each call consumes one unit of demand
	 * granted with ContentSubscription::Request().  Invocations
	 * arrive in offset order and never overlap.
	 *
	 * This function must return 0 if it has cancelled the
	 * subscription.
	 *
	 * @param src the data, never empty
	 * @return the number of bytes accepted; the rest will be offered
	 * again after the next Request() call; 0 if the handler cannot
	 * accept anything right now
	 */
	virtual std::size_t OnContentData(std::span<const std::byte> src) noexcept = 0;

	/**
	 * All data has been delivered.  The subscription has been
	 * destroyed already.
	 */
	virtual void OnContentEnd() noexcept = 0;

	/**
	 * Production has failed.  The subscription has been destroyed
	 * already.
	 *
	 * @param error the error; use GetBodyErrorCode() to classify it
	 */
	virtual void OnContentError(std::exception_ptr error) noexcept = 0;
};
