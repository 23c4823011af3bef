// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Queue.hxx"
#include "Job.hxx"
#include "event/InjectEvent.hxx"

#include <boost/intrusive/list.hpp>

#include <condition_variable>
#include <mutex>

#include <cassert>

class ThreadQueue {
public:
	std::mutex mutex;
	std::condition_variable cond;

	bool alive = true;

	using JobList = boost::intrusive::list<ThreadJob,
					       boost::intrusive::constant_time_size<false>>;

	JobList waiting, busy, done;

	InjectEvent notify;

	explicit ThreadQueue(EventLoop &event_loop)
		:notify(event_loop, [this]{ WakeupCallback(); }) {}

	~ThreadQueue() noexcept {
		assert(!alive);
	}

	bool IsEmpty() const noexcept {
		return waiting.empty() && busy.empty() && done.empty();
	}

	void WakeupCallback() noexcept;
};

void
ThreadQueue::WakeupCallback() noexcept
{
	std::unique_lock lock{mutex};

	while (!done.empty()) {
		ThreadJob &job = done.front();
		assert(job.state == ThreadJob::State::DONE);

		done.pop_front();

		job.state = ThreadJob::State::INITIAL;
		lock.unlock();
		job.Done();
		lock.lock();
	}

	const bool empty = IsEmpty();

	lock.unlock();

	if (empty)
		notify.Disable();
}

ThreadQueue *
thread_queue_new(EventLoop &event_loop)
{
	return new ThreadQueue(event_loop);
}

void
thread_queue_stop(ThreadQueue &q) noexcept
{
	const std::scoped_lock lock{q.mutex};
	q.alive = false;
	q.cond.notify_all();
}

void
thread_queue_free(ThreadQueue *q) noexcept
{
	delete q;
}

void
thread_queue_add(ThreadQueue &q, ThreadJob &job) noexcept
{
	{
		const std::scoped_lock lock{q.mutex};
		assert(q.alive);

		/* no-op if the job is already queued or being
		   worked on */
		if (job.state == ThreadJob::State::INITIAL) {
			job.state = ThreadJob::State::WAITING;
			q.waiting.push_back(job);
			q.cond.notify_one();
		}
	}

	q.notify.Enable();
}

ThreadJob *
thread_queue_wait(ThreadQueue &q) noexcept
{
	std::unique_lock lock{q.mutex};

	while (true) {
		if (!q.alive)
			return nullptr;

		if (!q.waiting.empty()) {
			auto &job = q.waiting.front();
			assert(job.state == ThreadJob::State::WAITING);

			job.state = ThreadJob::State::BUSY;
			q.waiting.pop_front();
			q.busy.push_back(job);
			return &job;
		}

		/* queue is empty, wait for a new job to be added */
		q.cond.wait(lock);
	}
}

void
thread_queue_done(ThreadQueue &q, ThreadJob &job) noexcept
{
	assert(job.state == ThreadJob::State::BUSY);

	{
		const std::scoped_lock lock{q.mutex};

		job.state = ThreadJob::State::DONE;
		q.busy.erase(q.busy.iterator_to(job));
		q.done.push_back(job);
	}

	q.notify.Schedule();
}

bool
thread_queue_cancel(ThreadQueue &q, ThreadJob &job) noexcept
{
	std::unique_lock lock{q.mutex};

	switch (job.state) {
	case ThreadJob::State::INITIAL:
		/* already idle */
		return true;

	case ThreadJob::State::WAITING:
		/* cancel it */
		q.waiting.erase(q.waiting.iterator_to(job));
		break;

	case ThreadJob::State::BUSY:
		/* no chance */
		return false;

	case ThreadJob::State::DONE:
		/* the worker has finished, but Done() has not been
		   invoked yet; remove it from the "done" list so
		   WakeupCallback() will not touch it */
		q.done.erase(q.done.iterator_to(job));
		break;
	}

	job.state = ThreadJob::State::INITIAL;

	const bool empty = q.IsEmpty();
	lock.unlock();

	if (empty)
		/* let the EventLoop exit when there's nothing left */
		q.notify.Disable();

	return true;
}
