// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ProgressSource.hxx"
#include "ForwardSubscription.hxx"

class ProgressSubscription final : public ForwardSubscription {
	ProgressHandler &progress;

public:
	ProgressSubscription(EventLoop &event_loop, ContentHandler &_handler,
			     ContentSource &upstream,
			     ProgressHandler &_progress)
		:ForwardSubscription(event_loop, _handler,
				     upstream.GetLength(), upstream),
		 progress(_progress) {}

protected:
	/* virtual methods from class ContentHandler */
	std::size_t OnContentData(std::span<const std::byte> src) noexcept override {
		const std::size_t nbytes = Deliver(src);
		if (nbytes > 0)
			progress.OnProgress(nbytes);
		return nbytes;
	}
};

class ProgressContentSource final : public ContentSource {
	EventLoop &event_loop;

	const ContentSourcePtr source;

	ProgressHandler &progress;

public:
	ProgressContentSource(EventLoop &_event_loop, ContentSourcePtr &&_source,
			      ProgressHandler &_progress) noexcept
		:event_loop(_event_loop), source(std::move(_source)),
		 progress(_progress) {}

	/* virtual methods from class ContentPublisher */
	ContentSubscription &Subscribe(ContentHandler &handler) override {
		return *new ProgressSubscription(event_loop, handler,
						 *source, progress);
	}

	bool IsReproducible() const noexcept override {
		return source->IsReproducible();
	}

	/* virtual methods from class ContentSource */
	std::optional<uint_least64_t> GetLength() const noexcept override {
		return source->GetLength();
	}

	std::string_view GetContentType() const noexcept override {
		return source->GetContentType();
	}
};

ContentSourcePtr
NewProgressContentSource(EventLoop &event_loop, ContentSourcePtr source,
			 ProgressHandler &handler) noexcept
{
	return std::make_unique<ProgressContentSource>(event_loop,
						       std::move(source),
						       handler);
}
