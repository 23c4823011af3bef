// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PublisherSource.hxx"
#include "ForwardSubscription.hxx"

#include <cassert>

class PublisherContentSource final : public ContentSource {
	EventLoop &event_loop;

	const std::unique_ptr<ContentPublisher> publisher;

public:
	PublisherContentSource(EventLoop &_event_loop,
			       std::unique_ptr<ContentPublisher> &&_publisher) noexcept
		:event_loop(_event_loop), publisher(std::move(_publisher)) {}

	/* virtual methods from class ContentPublisher */
	ContentSubscription &Subscribe(ContentHandler &handler) override;

	bool IsReproducible() const noexcept override {
		return publisher->IsReproducible();
	}

	/* virtual methods from class ContentSource */
	std::optional<uint_least64_t> GetLength() const noexcept override {
		return std::nullopt;
	}
};

class PublisherSubscription final : public ForwardSubscription {
public:
	PublisherSubscription(EventLoop &_event_loop, ContentHandler &_handler,
			      ContentPublisher &upstream)
		:ForwardSubscription(_event_loop, _handler, std::nullopt,
				     upstream) {}
};

ContentSubscription &
PublisherContentSource::Subscribe(ContentHandler &handler)
{
	return *new PublisherSubscription(event_loop, handler, *publisher);
}

ContentSourcePtr
NewPublisherContentSource(EventLoop &event_loop,
			  std::unique_ptr<ContentPublisher> publisher) noexcept
{
	assert(publisher);

	return std::make_unique<PublisherContentSource>(event_loop,
							std::move(publisher));
}
