// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Event.hxx"

#include <atomic>
#include <functional>

/**
 * Send notifications from any thread to the #EventLoop thread.  The
 * callback is invoked in the #EventLoop thread.  Multiple Schedule()
 * calls before the callback runs are collapsed into one invocation.
 */
class InjectEvent {
	using Callback = std::function<void()>;
	const Callback callback;

	const int fd;

	Event event;

	std::atomic_bool pending{false};

	bool enabled = false;

public:
	/**
	 * Throws std::system_error if the eventfd cannot be created.
	 */
	InjectEvent(EventLoop &event_loop, Callback _callback);
	~InjectEvent() noexcept;

	InjectEvent(const InjectEvent &) = delete;
	InjectEvent &operator=(const InjectEvent &) = delete;

	/**
	 * Register the eventfd with the #EventLoop.  As long as it is
	 * enabled, EventLoop::Dispatch() will not return by itself.
	 * May only be called from the #EventLoop thread.
	 */
	void Enable() noexcept {
		if (!enabled) {
			enabled = true;
			event.Add();
		}
	}

	void Disable() noexcept {
		if (enabled) {
			enabled = false;
			event.Delete();
		}
	}

	/**
	 * Thread-safe.
	 */
	void Schedule() noexcept;

private:
	static void EventFdCallback(evutil_socket_t fd, short events,
				    void *ctx) noexcept;
};
