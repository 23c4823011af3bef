// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Source.hxx"

#include <cstddef>

class EventLoop;

/**
 * Receives byte counts for progress reporting.
 */
class ProgressHandler {
public:
	/**
	 * Bytes were accepted by the consumer.  Called in the
	 * #EventLoop thread; must not block.
	 */
	virtual void OnProgress(std::size_t nbytes) noexcept = 0;
};

/**
 * Wrap a #ContentSource and report the number of bytes accepted by
 * each subscription's consumer.  Length, content type and
 * reproducibility are those of the wrapped source.
 *
 * The #ProgressHandler must outlive all subscriptions.
 */
ContentSourcePtr
NewProgressContentSource(EventLoop &event_loop, ContentSourcePtr source,
			 ProgressHandler &handler) noexcept;
