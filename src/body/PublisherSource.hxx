// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Source.hxx"

class EventLoop;

/**
 * Wrap an externally driven producer.  The length is unknown; the
 * source is reproducible if the publisher is.
 */
ContentSourcePtr
NewPublisherContentSource(EventLoop &event_loop,
			  std::unique_ptr<ContentPublisher> publisher) noexcept;
