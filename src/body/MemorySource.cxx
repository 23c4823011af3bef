// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MemorySource.hxx"
#include "Subscription.hxx"

#include <cassert>
#include <cstring>
#include <string>
#include <vector>

using BufferList = std::vector<std::span<const std::byte>>;

/**
 * The buffer list of a #MemoryContentSource.  It is shared with all
 * subscriptions, because they may outlive the source.
 */
struct MemoryContent {
	/**
	 * The copied data; empty for "unsafe" sources.
	 */
	std::vector<std::byte> storage;

	/**
	 * Each element points into #storage or into caller-owned
	 * memory.
	 */
	BufferList buffers;

	[[gnu::pure]]
	uint_least64_t GetLength() const noexcept {
		uint_least64_t result = 0;
		for (const auto &i : buffers)
			result += i.size();
		return result;
	}
};

using SharedMemoryContent = std::shared_ptr<const MemoryContent>;

class MemorySubscription final : public ContentSubscription {
	const SharedMemoryContent content;

	/**
	 * The index of the buffer being delivered.
	 */
	std::size_t current = 0;

	/**
	 * The number of bytes of the current buffer which have been
	 * accepted already.
	 */
	std::size_t position = 0;

public:
	MemorySubscription(EventLoop &event_loop, ContentHandler &_handler,
			   uint_least64_t length,
			   SharedMemoryContent _content) noexcept
		:ContentSubscription(event_loop, _handler, length),
		 content(std::move(_content))
	{
		if (length == 0)
			/* finish without waiting for demand */
			ScheduleProduce();
	}

protected:
	/* virtual methods from class ContentSubscription */
	void _Produce() noexcept override;
};

void
MemorySubscription::_Produce() noexcept
{
	const auto &buffers = content->buffers;

	while (current < buffers.size()) {
		const auto r = buffers[current].subspan(position);
		if (r.empty()) {
			++current;
			position = 0;
			continue;
		}

		if (!HasDemand())
			return;

		const std::size_t nbytes = Deliver(r);
		if (nbytes == 0)
			return;

		position += nbytes;
		if (nbytes < r.size())
			/* the handler is full; wait for more demand */
			return;
	}

	DestroyEof();
}

class MemoryContentSource final : public ContentSource {
	EventLoop &event_loop;

	const SharedMemoryContent content;

	const uint_least64_t length;

	const std::string content_type;

public:
	MemoryContentSource(EventLoop &_event_loop,
			    SharedMemoryContent &&_content,
			    std::string_view _content_type) noexcept
		:event_loop(_event_loop),
		 content(std::move(_content)),
		 length(content->GetLength()),
		 content_type(_content_type) {}

	/* virtual methods from class ContentPublisher */
	ContentSubscription &Subscribe(ContentHandler &handler) override {
		return *new MemorySubscription(event_loop, handler,
					       length, content);
	}

	bool IsReproducible() const noexcept override {
		return true;
	}

	/* virtual methods from class ContentSource */
	std::optional<uint_least64_t> GetLength() const noexcept override {
		return length;
	}

	std::string_view GetContentType() const noexcept override {
		return content_type;
	}
};

static ContentSourcePtr
NewMemoryContentSource(EventLoop &event_loop,
		       std::shared_ptr<MemoryContent> &&content,
		       std::string_view content_type=REQBODY_MIMETYPE_OCTET_STREAM) noexcept
{
	return std::make_unique<MemoryContentSource>(event_loop,
						     std::move(content),
						     content_type);
}

/**
 * Copy all buffers into one allocation and let the buffer list point
 * into it.
 */
static std::shared_ptr<MemoryContent>
CopyBuffers(std::span<const std::span<const std::byte>> src) noexcept
{
	auto content = std::make_shared<MemoryContent>();

	std::size_t total = 0;
	for (const auto &i : src)
		total += i.size();

	content->storage.resize(total);
	content->buffers.reserve(src.size());

	std::byte *p = content->storage.data();
	for (const auto &i : src) {
		if (!i.empty())
			std::memcpy(p, i.data(), i.size());
		content->buffers.emplace_back(p, i.size());
		p += i.size();
	}

	return content;
}

static std::shared_ptr<MemoryContent>
BorrowBuffers(std::span<const std::span<const std::byte>> src) noexcept
{
	auto content = std::make_shared<MemoryContent>();
	content->buffers.assign(src.begin(), src.end());
	return content;
}

ContentSourcePtr
NewEmptyContentSource(EventLoop &event_loop) noexcept
{
	return NewMemoryContentSource(event_loop,
				      std::make_shared<MemoryContent>());
}

ContentSourcePtr
NewCopiedContentSource(EventLoop &event_loop,
		       std::span<const std::byte> src) noexcept
{
	return NewMultiContentSource(event_loop, {&src, 1});
}

ContentSourcePtr
NewUnsafeContentSource(EventLoop &event_loop,
		       std::span<const std::byte> src) noexcept
{
	return NewUnsafeMultiContentSource(event_loop, {&src, 1});
}

ContentSourcePtr
NewRemainingContentSource(EventLoop &event_loop,
			  std::span<const std::byte> buffer,
			  std::size_t position) noexcept
{
	assert(position <= buffer.size());

	return NewCopiedContentSource(event_loop, buffer.subspan(position));
}

ContentSourcePtr
NewUnsafeRemainingContentSource(EventLoop &event_loop,
				std::span<const std::byte> buffer,
				std::size_t position) noexcept
{
	assert(position <= buffer.size());

	return NewUnsafeContentSource(event_loop, buffer.subspan(position));
}

ContentSourcePtr
NewMultiContentSource(EventLoop &event_loop,
		      std::span<const std::span<const std::byte>> buffers) noexcept
{
	return NewMemoryContentSource(event_loop, CopyBuffers(buffers));
}

ContentSourcePtr
NewUnsafeMultiContentSource(EventLoop &event_loop,
			    std::span<const std::span<const std::byte>> buffers) noexcept
{
	return NewMemoryContentSource(event_loop, BorrowBuffers(buffers));
}

ContentSourcePtr
NewStringContentSource(EventLoop &event_loop, std::string_view s,
		       std::string_view content_type) noexcept
{
	const std::span<const std::byte> src{(const std::byte *)s.data(), s.size()};
	return NewMemoryContentSource(event_loop, CopyBuffers({&src, 1}),
				      content_type);
}
