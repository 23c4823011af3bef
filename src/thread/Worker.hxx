// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * A thread that performs queued work.
 */

#pragma once

#include <pthread.h>

class ThreadQueue;

struct thread_worker {
	pthread_t thread;

	ThreadQueue *queue;
};

/**
 * Throws std::system_error on error.
 */
void
thread_worker_create(struct thread_worker &w, ThreadQueue &q);

/**
 * Wait for the thread to exit.  You must call thread_queue_stop()
 * prior to this function.
 */
static inline void
thread_worker_join(struct thread_worker &w) noexcept
{
	pthread_join(w.thread, nullptr);
}
