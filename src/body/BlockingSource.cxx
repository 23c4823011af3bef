// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BlockingSource.hxx"
#include "BlockingChannel.hxx"
#include "ReaderSource.hxx"
#include "Reader.hxx"
#include "Subscription.hxx"
#include "Error.hxx"
#include "event/InjectEvent.hxx"

#include <vector>

class BlockingSubscription final : public ContentSubscription {
	const std::shared_ptr<BlockingChannel> channel;

	/**
	 * Notified by the writer thread.  While it is enabled, the
	 * #EventLoop keeps running.
	 */
	InjectEvent inject;

	/**
	 * The portion being delivered.
	 */
	std::vector<std::byte> current;
	std::size_t position = 0;

	/**
	 * The error the writer receives when this object is
	 * destroyed.
	 */
	std::exception_ptr detach_reason;

public:
	BlockingSubscription(EventLoop &event_loop, ContentHandler &_handler,
			     std::optional<uint_least64_t> length,
			     std::shared_ptr<BlockingChannel> _channel)
		:ContentSubscription(event_loop, _handler, length),
		 channel(std::move(_channel)),
		 inject(event_loop, [this]{ ScheduleProduce(); })
	{
		inject.Enable();
		channel->Attach(inject);

		/* check whether the writer has finished already */
		ScheduleProduce();
	}

	~BlockingSubscription() noexcept override {
		channel->Detach(std::move(detach_reason));
	}

protected:
	/* virtual methods from class ContentSubscription */
	void _OnDemand(uint_least64_t n) noexcept override {
		channel->Grant(n);
		ScheduleProduce();
	}

	void _Produce() noexcept override;

	void _Cancel() noexcept override {
		detach_reason = std::make_exception_ptr(BodyError(BodyErrorCode::CANCELLED,
								  "Consumer has cancelled"));
		Destroy();
	}

private:
	/**
	 * Make sure #current contains data.  Finishes the subscription
	 * if the writer has closed or failed.
	 *
	 * @return true if data is available, false if not (or if this
	 * object has been destroyed)
	 */
	bool Fill() noexcept;

	void Fail(std::exception_ptr ep) noexcept {
		detach_reason = ep;
		DestroyError(std::move(ep));
	}
};

bool
BlockingSubscription::Fill() noexcept
{
	if (position < current.size())
		return true;

	std::exception_ptr error;
	switch (channel->Pop(current, error)) {
	case BlockingChannel::PopResult::DATA:
		position = 0;
		return true;

	case BlockingChannel::PopResult::EMPTY:
		break;

	case BlockingChannel::PopResult::END:
		/* fails with INVALID_LENGTH if the writer has closed
		   before the declared length was reached */
		DestroyEof();
		break;

	case BlockingChannel::PopResult::ERROR:
		Fail(std::move(error));
		break;
	}

	return false;
}

void
BlockingSubscription::_Produce() noexcept
{
	while (Fill()) {
		if (!HasDemand())
			return;

		const std::size_t nbytes =
			Deliver({current.data() + position,
				 current.size() - position});
		if (nbytes == 0)
			return;

		position += nbytes;
		channel->Consumed(nbytes);

		if (position < current.size())
			/* the handler is full; wait for more demand */
			return;
	}
}

BlockingContentSource::BlockingContentSource(EventLoop &_event_loop,
					     std::optional<int_least64_t> _length,
					     std::size_t capacity,
					     std::chrono::steady_clock::duration _subscribe_timeout)
	:event_loop(_event_loop),
	 channel(std::make_shared<BlockingChannel>(capacity,
						   CheckDeclaredLength(_length))),
	 length(CheckDeclaredLength(_length)),
	 subscribe_timeout(_subscribe_timeout)
{
	if (capacity == 0)
		throw BodyError(BodyErrorCode::INVALID_ARGUMENT,
				"Capacity must be positive");
}

BlockingContentSource::~BlockingContentSource() noexcept = default;

ContentSubscription &
BlockingContentSource::Subscribe(ContentHandler &handler)
{
	if (subscribed)
		throw BodyError(BodyErrorCode::NOT_REPRODUCIBLE,
				"Blocking content can be consumed only once");

	auto &s = *new BlockingSubscription(event_loop, handler,
					    length, channel);
	subscribed = true;
	return s;
}

bool
BlockingContentSource::WaitForSubscription(std::chrono::steady_clock::duration timeout) noexcept
{
	return channel->WaitForSubscription(timeout);
}

void
BlockingContentSource::Cancel() noexcept
{
	Fail(std::make_exception_ptr(BodyError(BodyErrorCode::CANCELLED,
					       "Writer has cancelled")));
}

void
BlockingContentSource::Write(std::span<const std::byte> src)
{
	channel->Write(src, subscribe_timeout);
}

void
BlockingContentSource::Close() noexcept
{
	channel->Close();
}

void
BlockingContentSource::Fail(std::exception_ptr ep) noexcept
{
	channel->Fail(std::move(ep));
}

uint_least64_t
BlockingInputSource::WriteFrom(SyncReader &reader)
{
	std::vector<std::byte> buffer(read_buffer_size);
	uint_least64_t total = 0;

	while (true) {
		std::size_t nbytes;

		try {
			nbytes = reader.Read(buffer);
		} catch (...) {
			Fail(NestUpstreamError(std::current_exception(),
					       "Failed to read content"));
			throw;
		}

		if (nbytes == 0)
			break;

		Write({buffer.data(), nbytes});
		total += nbytes;
	}

	Close();
	return total;
}
