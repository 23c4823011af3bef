// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <utility>

#include <sys/types.h>

/**
 * An owned file descriptor which is closed automatically.
 */
class UniqueFd {
	int fd = -1;

public:
	UniqueFd() noexcept = default;

	explicit UniqueFd(int _fd) noexcept
		:fd(_fd) {}

	UniqueFd(UniqueFd &&src) noexcept
		:fd(std::exchange(src.fd, -1)) {}

	~UniqueFd() noexcept {
		Close();
	}

	UniqueFd &operator=(UniqueFd &&src) noexcept {
		std::swap(fd, src.fd);
		return *this;
	}

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	int Get() const noexcept {
		return fd;
	}

	int Steal() noexcept {
		return std::exchange(fd, -1);
	}

	void Close() noexcept;

	/**
	 * Open a file read-only.  Throws std::system_error on error.
	 */
	static UniqueFd OpenReadOnly(const char *path);

	/**
	 * Create an anonymous pipe.  Throws std::system_error on
	 * error.
	 */
	static std::pair<UniqueFd, UniqueFd> CreatePipe();

	/**
	 * Read into the buffer, retrying after EINTR.  Throws
	 * std::system_error on error.
	 *
	 * @return the number of bytes read, 0 at end of file
	 */
	std::size_t Read(std::span<std::byte> dest) const;

	/**
	 * Like Read(), but at the given file offset.
	 */
	std::size_t ReadAt(std::span<std::byte> dest, off_t offset) const;

	/**
	 * Write the whole buffer, retrying after EINTR and short
	 * writes.  Throws std::system_error on error.
	 */
	void WriteFull(std::span<const std::byte> src) const;
};
