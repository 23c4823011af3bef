// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Pool.hxx"
#include "Queue.hxx"
#include "Worker.hxx"
#include "Logger.hxx"

#include <vector>

#include <cassert>

static ThreadQueue *global_thread_queue;
static unsigned worker_thread_count = 4;
static std::vector<struct thread_worker> worker_threads;

void
thread_pool_set_size(unsigned n) noexcept
{
	assert(n > 0);

	worker_thread_count = n;
}

static void
thread_pool_start()
{
	assert(global_thread_queue != nullptr);
	assert(worker_threads.empty());

	worker_threads.reserve(worker_thread_count);

	try {
		for (unsigned i = 0; i < worker_thread_count; ++i) {
			worker_threads.emplace_back();
			thread_worker_create(worker_threads.back(),
					     *global_thread_queue);
		}
	} catch (...) {
		/* the last element was never launched */
		worker_threads.pop_back();

		LLogger("thread_pool")(1, "Failed to launch worker thread: ",
				       std::current_exception());

		thread_pool_stop();
		thread_pool_join();
		thread_pool_deinit();
		throw;
	}

	LogFmt(4, "thread_pool", "launched {} worker threads",
	       worker_threads.size());
}

ThreadQueue &
thread_pool_get_queue(EventLoop &event_loop)
{
	if (global_thread_queue == nullptr) {
		/* initial call - create the queue and launch worker
		   threads */
		global_thread_queue = thread_queue_new(event_loop);
		thread_pool_start();
	}

	return *global_thread_queue;
}

void
thread_pool_stop() noexcept
{
	if (global_thread_queue == nullptr)
		return;

	thread_queue_stop(*global_thread_queue);
}

void
thread_pool_join() noexcept
{
	for (auto &i : worker_threads)
		thread_worker_join(i);

	worker_threads.clear();
}

void
thread_pool_deinit() noexcept
{
	if (global_thread_queue == nullptr)
		return;

	thread_queue_free(global_thread_queue);
	global_thread_queue = nullptr;
}
