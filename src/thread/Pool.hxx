// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * The global worker thread pool which performs all blocking I/O on
 * behalf of file and stream content sources.
 */

#pragma once

class EventLoop;
class ThreadQueue;

/**
 * Set the number of worker threads to be launched by the first
 * thread_pool_get_queue() call.  Has no effect after the pool has
 * been started.
 */
void
thread_pool_set_size(unsigned n) noexcept;

/**
 * Returns the global #ThreadQueue instance.  The first call to this
 * function creates the queue and starts the worker threads.  To shut
 * down, call thread_pool_stop(), thread_pool_join() and
 * thread_pool_deinit().
 *
 * Throws std::system_error if a worker thread cannot be launched.
 */
ThreadQueue &
thread_pool_get_queue(EventLoop &event_loop);

void
thread_pool_stop() noexcept;

void
thread_pool_join() noexcept;

void
thread_pool_deinit() noexcept;
