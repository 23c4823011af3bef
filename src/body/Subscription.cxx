// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Subscription.hxx"
#include "Handler.hxx"
#include "Error.hxx"

#include <cassert>

ContentSubscription::ContentSubscription(EventLoop &event_loop,
					 ContentHandler &_handler,
					 std::optional<uint_least64_t> _expected_length) noexcept
	:handler(_handler),
	 defer_produce(event_loop, [this]{ OnDeferredProduce(); }),
	 expected_length(_expected_length)
{
}

ContentSubscription::~ContentSubscription() noexcept
{
#ifndef NDEBUG
	assert(!destroyed);
	destroyed = true;
#endif
}

void
ContentSubscription::Request(uint_least64_t n) noexcept
{
	assert(!destroyed);

	if (n == 0) {
		if (!pending_error)
			pending_error = std::make_exception_ptr(BodyError(BodyErrorCode::PROTOCOL_VIOLATION,
									  "Non-positive demand requested"));
		ScheduleProduce();
		return;
	}

	if (n >= UNBOUNDED_DEMAND - demand)
		demand = UNBOUNDED_DEMAND;
	else
		demand += n;

	_OnDemand(n);
}

void
ContentSubscription::OnDeferredProduce() noexcept
{
	if (pending_error) {
		DestroyError(std::move(pending_error));
		return;
	}

	_Produce();
}

std::size_t
ContentSubscription::Deliver(std::span<const std::byte> src) noexcept
{
	assert(!destroyed);
	assert(!src.empty());

	if (demand == 0) {
		DestroyError(std::make_exception_ptr(BodyError(BodyErrorCode::PROTOCOL_VIOLATION,
							       "Data delivered without demand")));
		return 0;
	}

	if (src.size() > GetRemaining()) {
		DestroyError(std::make_exception_ptr(FmtBodyError(BodyErrorCode::INVALID_LENGTH,
								  "Content is longer than the announced {} bytes",
								  *expected_length)));
		return 0;
	}

	if (demand != UNBOUNDED_DEMAND)
		--demand;

	const std::size_t consumed = handler.OnContentData(src);
	if (consumed == 0)
		/* the handler may have cancelled us */
		return 0;

	assert(consumed <= src.size());
	delivered += consumed;
	return consumed;
}

void
ContentSubscription::DestroyEof() noexcept
{
	if (expected_length && delivered != *expected_length) {
		DestroyError(std::make_exception_ptr(FmtBodyError(BodyErrorCode::INVALID_LENGTH,
								  "Content ended after {} of {} bytes",
								  delivered, *expected_length)));
		return;
	}

	auto &_handler = handler;
	Destroy();
	_handler.OnContentEnd();
}

void
ContentSubscription::DestroyError(std::exception_ptr ep) noexcept
{
	auto &_handler = handler;
	Destroy();
	_handler.OnContentError(std::move(ep));
}
