// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RecordingContentHandler.hxx"
#include "ScriptedPublisher.hxx"
#include "body/ProgressSource.hxx"
#include "body/MemorySource.hxx"
#include "body/Error.hxx"
#include "event/Loop.hxx"

#include <gtest/gtest.h>

#include <vector>

using namespace std::string_view_literals;

struct RecordingProgressHandler final : ProgressHandler {
	std::vector<std::size_t> calls;
	uint_least64_t total = 0;

	void OnProgress(std::size_t nbytes) noexcept override {
		calls.push_back(nbytes);
		total += nbytes;
	}
};

TEST(ProgressSource, Basic)
{
	EventLoop event_loop;
	RecordingProgressHandler progress;

	auto source = NewProgressContentSource(event_loop,
					       NewStringContentSource(event_loop,
								      "hello world"),
					       progress);
	EXPECT_EQ(*source->GetLength(), 11U);
	EXPECT_TRUE(source->IsReproducible());
	EXPECT_EQ(source->GetContentType(), "text/plain; charset=UTF-8"sv);

	RecordingContentHandler handler;
	handler.accept_limit = 4;
	handler.Subscribe(*source);
	handler.Request(1);
	event_loop.Dispatch();

	EXPECT_EQ(handler.state, RecordingContentHandler::State::END);
	EXPECT_EQ(handler.data, "hello world");

	/* only accepted bytes are reported */
	EXPECT_EQ(progress.calls, (std::vector<std::size_t>{4, 4, 3}));
	EXPECT_EQ(progress.total, 11U);
}

TEST(ProgressSource, Error)
{
	EventLoop event_loop;
	RecordingProgressHandler progress;

	auto source = NewProgressContentSource(event_loop,
					       std::make_unique<ScriptedSource>(event_loop,
										std::vector<std::string>{"abc"},
										std::nullopt,
										std::make_exception_ptr(std::runtime_error("Broken pipe"))),
					       progress);
	EXPECT_FALSE(source->GetLength());

	RecordingContentHandler handler;
	handler.Subscribe(*source);
	handler.Request(1);
	event_loop.Dispatch();

	EXPECT_EQ(handler.state, RecordingContentHandler::State::ERROR);
	EXPECT_EQ(GetBodyErrorCode(handler.error), BodyErrorCode::UPSTREAM);
	EXPECT_EQ(progress.total, 3U);
}

TEST(ProgressSource, Cancel)
{
	EventLoop event_loop;
	RecordingProgressHandler progress;

	const std::span<const std::byte> buffers[] = {
		AsBytes("foo"),
		AsBytes("bar"),
	};

	auto source = NewProgressContentSource(event_loop,
					       NewMultiContentSource(event_loop,
								     buffers),
					       progress);

	RecordingContentHandler handler;
	handler.cancel_after = 3;
	handler.Subscribe(*source);
	handler.Request(1);
	event_loop.Dispatch();

	EXPECT_EQ(handler.state, RecordingContentHandler::State::CANCELLED);

	/* nothing was accepted */
	EXPECT_TRUE(progress.calls.empty());
}
