// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ReaderSource.hxx"
#include "Reader.hxx"
#include "WorkerSubscription.hxx"
#include "Error.hxx"

#include <cassert>

class ReaderSubscription final : public WorkerSubscription {
	const std::unique_ptr<SyncReader> reader;

public:
	ReaderSubscription(EventLoop &event_loop, ContentHandler &_handler,
			   ThreadQueue &_queue, std::size_t read_buffer_size,
			   std::optional<uint_least64_t> length,
			   std::unique_ptr<SyncReader> &&_reader) noexcept
		:WorkerSubscription(event_loop, _handler, length,
				    _queue, read_buffer_size),
		 reader(std::move(_reader)) {}

protected:
	std::size_t ReadInWorker(std::span<std::byte> dest) override {
		return reader->Read(dest);
	}
};

class ReaderContentSource final : public ContentSource {
	EventLoop &event_loop;
	ThreadQueue &queue;

	/**
	 * Moved to the subscription; nullptr after Subscribe().
	 */
	std::unique_ptr<SyncReader> reader;

	const std::optional<uint_least64_t> length;

	const std::size_t read_buffer_size;

public:
	ReaderContentSource(EventLoop &_event_loop, ThreadQueue &_queue,
			    std::unique_ptr<SyncReader> &&_reader,
			    std::optional<uint_least64_t> _length,
			    std::size_t _read_buffer_size) noexcept
		:event_loop(_event_loop), queue(_queue),
		 reader(std::move(_reader)), length(_length),
		 read_buffer_size(_read_buffer_size) {}

	/* virtual methods from class ContentPublisher */
	ContentSubscription &Subscribe(ContentHandler &handler) override {
		if (!reader)
			throw BodyError(BodyErrorCode::NOT_REPRODUCIBLE,
					"Stream content can be consumed only once");

		return *new ReaderSubscription(event_loop, handler, queue,
					       read_buffer_size, length,
					       std::move(reader));
	}

	bool IsReproducible() const noexcept override {
		return false;
	}

	/* virtual methods from class ContentSource */
	std::optional<uint_least64_t> GetLength() const noexcept override {
		return length;
	}
};

std::optional<uint_least64_t>
CheckDeclaredLength(std::optional<int_least64_t> length)
{
	if (!length)
		return std::nullopt;

	if (*length < 0)
		throw FmtBodyError(BodyErrorCode::INVALID_LENGTH,
				   "Negative content length: {}", *length);

	return uint_least64_t(*length);
}

ContentSourcePtr
NewReaderContentSource(EventLoop &event_loop, ThreadQueue &queue,
		       std::unique_ptr<SyncReader> reader,
		       std::optional<int_least64_t> length,
		       std::size_t read_buffer_size)
{
	assert(reader);

	if (read_buffer_size == 0)
		throw BodyError(BodyErrorCode::INVALID_ARGUMENT,
				"Read buffer size must be positive");

	return std::make_unique<ReaderContentSource>(event_loop, queue,
						     std::move(reader),
						     CheckDeclaredLength(length),
						     read_buffer_size);
}
