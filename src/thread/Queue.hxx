// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * A queue that manages work for worker threads.  This is the
 * execution context for all blocking I/O: the #EventLoop thread
 * never reads files or synchronous streams itself.
 */

#pragma once

class EventLoop;
class ThreadQueue;
class ThreadJob;

/**
 * Throws std::system_error on error.
 */
ThreadQueue *
thread_queue_new(EventLoop &event_loop);

/**
 * Cancel all thread_queue_wait() calls and refuse all further calls.
 * This is used to initiate shutdown of all threads connected to this
 * queue.
 */
void
thread_queue_stop(ThreadQueue &q) noexcept;

void
thread_queue_free(ThreadQueue *q) noexcept;

/**
 * Enqueue a job, and wake up an idle thread (if there is any).
 */
void
thread_queue_add(ThreadQueue &q, ThreadJob &job) noexcept;

/**
 * Dequeue an existing job or wait for a new job, and reserve it.
 *
 * @return nullptr if thread_queue_stop() has been called
 */
ThreadJob *
thread_queue_wait(ThreadQueue &q) noexcept;

/**
 * Mark the specified job (returned by thread_queue_wait()) as "done".
 */
void
thread_queue_done(ThreadQueue &q, ThreadJob &job) noexcept;

/**
 * Cancel a job that has been queued.
 *
 * @return true if the job is now canceled, false if the job is
 * currently being processed
 */
bool
thread_queue_cancel(ThreadQueue &q, ThreadJob &job) noexcept;
