// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/intrusive/list_hook.hpp>

/**
 * A job that shall be executed in a worker thread.
 */
class ThreadJob
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::normal_link>> {
public:
	enum class State {
		/**
		 * The job is not in any queue.
		 */
		INITIAL,

		/**
		 * The job has been added to the queue, but is not
		 * being worked on yet.
		 */
		WAITING,

		/**
		 * The job is being performed via Run().
		 */
		BUSY,

		/**
		 * The job has finished, but the Done() method has not
		 * been invoked yet.
		 */
		DONE,
	};

	/**
	 * Protected by the #ThreadQueue mutex.
	 */
	State state = State::INITIAL;

	/**
	 * Do the work.  This is run in a worker thread.  It must not
	 * throw; errors shall be stored in the job and evaluated by
	 * Done().
	 */
	virtual void Run() noexcept = 0;

	/**
	 * Called in the main thread after Run() has finished.
	 */
	virtual void Done() noexcept = 0;

protected:
	ThreadJob() noexcept = default;
	~ThreadJob() noexcept = default;
};
