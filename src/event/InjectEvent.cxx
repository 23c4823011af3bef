// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "InjectEvent.hxx"
#include "body/Error.hxx"

#include <cstdint>

#include <sys/eventfd.h>
#include <unistd.h>

static int
CreateEventFd()
{
	int fd = eventfd(0, EFD_NONBLOCK|EFD_CLOEXEC);
	if (fd < 0)
		throw MakeErrno("eventfd() failed");

	return fd;
}

InjectEvent::InjectEvent(EventLoop &event_loop, Callback _callback)
	:callback(std::move(_callback)),
	 fd(CreateEventFd()),
	 event(event_loop, fd, EV_READ|EV_PERSIST, EventFdCallback, this)
{
}

InjectEvent::~InjectEvent() noexcept
{
	Disable();
	close(fd);
}

void
InjectEvent::Schedule() noexcept
{
	if (!pending.exchange(true)) {
		static constexpr uint64_t value = 1;
		[[maybe_unused]] ssize_t nbytes = write(fd, &value, sizeof(value));
	}
}

void
InjectEvent::EventFdCallback(evutil_socket_t, short, void *ctx) noexcept
{
	auto &e = *(InjectEvent *)ctx;

	uint64_t value;
	[[maybe_unused]] ssize_t nbytes = read(e.fd, &value, sizeof(value));

	if (e.pending.exchange(false))
		e.callback();
}
