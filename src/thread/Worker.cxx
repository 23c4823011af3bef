// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Worker.hxx"
#include "Queue.hxx"
#include "Job.hxx"
#include "body/Error.hxx"

static void *
thread_worker_run(void *ctx) noexcept
{
	/* reduce glibc's thread cancellation overhead */
	pthread_setcancelstate(PTHREAD_CANCEL_DISABLE, nullptr);

	struct thread_worker &w = *(struct thread_worker *)ctx;
	ThreadQueue &q = *w.queue;

	ThreadJob *job;
	while ((job = thread_queue_wait(q)) != nullptr) {
		job->Run();
		thread_queue_done(q, *job);
	}

	return nullptr;
}

void
thread_worker_create(struct thread_worker &w, ThreadQueue &q)
{
	w.queue = &q;

	pthread_attr_t attr;
	pthread_attr_init(&attr);

	/* 256 kB stack ought to be enough */
	pthread_attr_setstacksize(&attr, 256 * 1024);

	int error = pthread_create(&w.thread, &attr, thread_worker_run, &w);
	pthread_attr_destroy(&attr);

	if (error != 0)
		throw MakeErrno(error, "Failed to create worker thread");
}
