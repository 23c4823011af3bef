// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "UniqueFd.hxx"
#include "body/Error.hxx"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

void
UniqueFd::Close() noexcept
{
	if (fd >= 0)
		close(std::exchange(fd, -1));
}

UniqueFd
UniqueFd::OpenReadOnly(const char *path)
{
	int result = open(path, O_RDONLY|O_CLOEXEC|O_NOCTTY);
	if (result < 0)
		throw FmtErrno("Failed to open {}", path);

	return UniqueFd{result};
}

std::pair<UniqueFd, UniqueFd>
UniqueFd::CreatePipe()
{
	int fds[2];
	if (pipe2(fds, O_CLOEXEC) < 0)
		throw MakeErrno("pipe() failed");

	return {UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

std::size_t
UniqueFd::Read(std::span<std::byte> dest) const
{
	while (true) {
		ssize_t nbytes = read(fd, dest.data(), dest.size());
		if (nbytes >= 0)
			return std::size_t(nbytes);

		if (errno != EINTR)
			throw MakeErrno("Failed to read");
	}
}

std::size_t
UniqueFd::ReadAt(std::span<std::byte> dest, off_t offset) const
{
	while (true) {
		ssize_t nbytes = pread(fd, dest.data(), dest.size(), offset);
		if (nbytes >= 0)
			return std::size_t(nbytes);

		if (errno != EINTR)
			throw MakeErrno("Failed to read");
	}
}

void
UniqueFd::WriteFull(std::span<const std::byte> src) const
{
	while (!src.empty()) {
		ssize_t nbytes = write(fd, src.data(), src.size());
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw MakeErrno("Failed to write");
		}

		src = src.subspan(nbytes);
	}
}
