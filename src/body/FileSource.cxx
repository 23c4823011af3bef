// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileSource.hxx"
#include "WorkerSubscription.hxx"
#include "Error.hxx"
#include "io/UniqueFd.hxx"
#include "Logger.hxx"

#include <string>

#include <sys/stat.h>

static const LLogger file_logger("file_source");

/**
 * The attributes of the file observed when the source was created.
 */
struct FileSnapshot {
	std::string path;

	uint_least64_t size;

	struct timespec mtime;

	[[gnu::pure]]
	bool Matches(const struct stat &st) const noexcept {
		return uint_least64_t(st.st_size) == size &&
			st.st_mtim.tv_sec == mtime.tv_sec &&
			st.st_mtim.tv_nsec == mtime.tv_nsec;
	}
};

class FileSubscription final : public WorkerSubscription {
	const FileSnapshot snapshot;

	/**
	 * Opened in the worker thread by the first read.
	 */
	UniqueFd fd;

	/**
	 * The file offset and the number of bytes still to be read.
	 * Only accessed by the worker thread.
	 */
	uint_least64_t offset, rest;

public:
	FileSubscription(EventLoop &event_loop, ContentHandler &_handler,
			 ThreadQueue &_queue, std::size_t read_buffer_size,
			 const FileSnapshot &_snapshot,
			 uint_least64_t _offset, uint_least64_t _length) noexcept
		:WorkerSubscription(event_loop, _handler, _length,
				    _queue, read_buffer_size),
		 snapshot(_snapshot),
		 offset(_offset), rest(_length)
	{
		if (_length == 0)
			/* finish without waiting for demand */
			ScheduleProduce();
	}

protected:
	std::size_t ReadInWorker(std::span<std::byte> dest) override;
	std::exception_ptr WrapError(std::exception_ptr ep) noexcept override;

	bool IsEndAtExpectedLength() const noexcept override {
		return true;
	}

private:
	void Open();
};

inline void
FileSubscription::Open()
{
	fd = UniqueFd::OpenReadOnly(snapshot.path.c_str());

	struct stat st;
	if (fstat(fd.Get(), &st) < 0)
		throw FmtErrno("Failed to stat {}", snapshot.path);

	if (!snapshot.Matches(st))
		throw FmtBodyError(BodyErrorCode::UPSTREAM,
				   "File {} was modified after the content source was created",
				   snapshot.path);
}

std::size_t
FileSubscription::ReadInWorker(std::span<std::byte> dest)
{
	if (rest == 0)
		return 0;

	if (!fd.IsDefined())
		Open();

	if (dest.size() > rest)
		dest = dest.first(rest);

	const std::size_t nbytes = fd.ReadAt(dest, off_t(offset));
	if (nbytes == 0)
		throw FmtBodyError(BodyErrorCode::UPSTREAM,
				   "File {} was truncated", snapshot.path);

	offset += nbytes;
	rest -= nbytes;
	return nbytes;
}

std::exception_ptr
FileSubscription::WrapError(std::exception_ptr ep) noexcept
{
	ep = NestUpstreamError(std::move(ep), "Failed to read file");
	file_logger(2, "", ep);
	return ep;
}

class FileContentSource final : public ContentSource {
	EventLoop &event_loop;
	ThreadQueue &queue;

	const FileSnapshot snapshot;

	const uint_least64_t offset, length;

	const std::size_t read_buffer_size;

public:
	FileContentSource(EventLoop &_event_loop, ThreadQueue &_queue,
			  FileSnapshot &&_snapshot,
			  uint_least64_t _offset, uint_least64_t _length,
			  std::size_t _read_buffer_size) noexcept
		:event_loop(_event_loop), queue(_queue),
		 snapshot(std::move(_snapshot)),
		 offset(_offset), length(_length),
		 read_buffer_size(_read_buffer_size) {}

	/* virtual methods from class ContentPublisher */
	ContentSubscription &Subscribe(ContentHandler &handler) override {
		return *new FileSubscription(event_loop, handler, queue,
					     read_buffer_size, snapshot,
					     offset, length);
	}

	bool IsReproducible() const noexcept override {
		return true;
	}

	/* virtual methods from class ContentSource */
	std::optional<uint_least64_t> GetLength() const noexcept override {
		return length;
	}
};

static void
CheckReadBufferSize(std::size_t read_buffer_size)
{
	if (read_buffer_size == 0)
		throw BodyError(BodyErrorCode::INVALID_ARGUMENT,
				"Read buffer size must be positive");
}

static FileSnapshot
StatFile(const char *path)
{
	struct stat st;
	if (stat(path, &st) < 0)
		throw FmtErrno("Failed to stat {}", path);

	if (!S_ISREG(st.st_mode))
		throw FmtBodyError(BodyErrorCode::INVALID_ARGUMENT,
				   "Not a regular file: {}", path);

	return {path, uint_least64_t(st.st_size), st.st_mtim};
}

ContentSourcePtr
NewFileContentSource(EventLoop &event_loop, ThreadQueue &queue,
		     const char *path, std::size_t read_buffer_size)
{
	CheckReadBufferSize(read_buffer_size);

	auto snapshot = StatFile(path);
	const uint_least64_t size = snapshot.size;

	return std::make_unique<FileContentSource>(event_loop, queue,
						   std::move(snapshot),
						   0, size,
						   read_buffer_size);
}

ContentSourcePtr
NewFileContentSource(EventLoop &event_loop, ThreadQueue &queue,
		     const char *path,
		     uint_least64_t offset, uint_least64_t length,
		     std::size_t read_buffer_size)
{
	CheckReadBufferSize(read_buffer_size);

	auto snapshot = StatFile(path);

	if (offset > snapshot.size || length > snapshot.size - offset)
		throw FmtBodyError(BodyErrorCode::INVALID_ARGUMENT,
				   "Range {}+{} exceeds the size of {} ({} bytes)",
				   offset, length, path, snapshot.size);

	return std::make_unique<FileContentSource>(event_loop, queue,
						   std::move(snapshot),
						   offset, length,
						   read_buffer_size);
}
