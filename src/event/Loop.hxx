// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "DeferEvent.hxx"

#include <boost/intrusive/list.hpp>

#include <event.h>

#include <cassert>

/**
 * Wrapper for a struct event_base.  This is the dispatch context:
 * all content sources, subscriptions and splitters are driven by
 * exactly one thread which runs Dispatch().
 */
class EventLoop {
	struct event_base *const event_base;

	boost::intrusive::list<DeferEvent,
			       boost::intrusive::member_hook<DeferEvent,
							     DeferEvent::SiblingsHook,
							     &DeferEvent::siblings>,
			       boost::intrusive::constant_time_size<false>> defer;

	bool quit = false;

public:
	/**
	 * Throws std::runtime_error if libevent fails to initialize.
	 */
	EventLoop();

	~EventLoop() noexcept {
		assert(defer.empty());

		::event_base_free(event_base);
	}

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	struct event_base *Get() noexcept {
		return event_base;
	}

	/**
	 * Run the loop until Break() is called or until there are no
	 * more registered events and no deferred calls.
	 */
	void Dispatch() noexcept {
		quit = false;

		RunDeferred();
		while (!quit && Loop(EVLOOP_ONCE))
			RunDeferred();
	}

	/**
	 * Run all deferred calls and all events which are ready,
	 * without blocking.
	 */
	void LoopNonBlock() noexcept {
		RunDeferred();
		Loop(EVLOOP_NONBLOCK);
		RunDeferred();
	}

	void Break() noexcept {
		quit = true;
		::event_base_loopbreak(event_base);
	}

	void Defer(DeferEvent &e) noexcept;
	void CancelDefer(DeferEvent &e) noexcept;

private:
	bool Loop(int flags) noexcept {
		return ::event_base_loop(event_base, flags) == 0;
	}

	void RunDeferred() noexcept;
};
