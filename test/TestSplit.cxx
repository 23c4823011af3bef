// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RecordingContentHandler.hxx"
#include "ScriptedPublisher.hxx"
#include "TempFile.hxx"
#include "body/Split.hxx"
#include "body/MemorySource.hxx"
#include "body/ProgressSource.hxx"
#include "body/FileSource.hxx"
#include "body/BlockingSource.hxx"
#include "body/Error.hxx"
#include "event/Loop.hxx"
#include "thread/Queue.hxx"
#include "thread/Worker.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

/**
 * Collects the chunks of a #ContentSplitter and (optionally) consumes
 * them right away.
 */
struct ChunkCollector final : ChunkHandler, SplitCompletionHandler {
	enum class State {
		WAITING,
		END,
		ERROR,
	};

	struct Chunk {
		ContentSourcePtr source;
		uint_least64_t offset;
		std::optional<uint_least64_t> length;
		RecordingContentHandler handler;
	};

	std::vector<std::unique_ptr<Chunk>> chunks;

	State chunks_state = State::WAITING;
	std::exception_ptr chunks_error;

	State completion_state = State::WAITING;
	std::exception_ptr completion_error;

	/**
	 * Subscribe to each chunk as soon as it is emitted?
	 */
	bool consume = true;

	void Consume(Chunk &chunk) {
		chunk.handler.Subscribe(*chunk.source);
		chunk.handler.Request(1);
	}

	std::string GetData() const {
		std::string result;
		for (const auto &i : chunks)
			result += i->handler.data;
		return result;
	}

	std::vector<uint_least64_t> GetOffsets() const {
		std::vector<uint_least64_t> result;
		for (const auto &i : chunks)
			result.push_back(i->offset);
		return result;
	}

	std::vector<uint_least64_t> GetLengths() const {
		std::vector<uint_least64_t> result;
		for (const auto &i : chunks)
			result.push_back(i->length.value_or(UINT_LEAST64_MAX));
		return result;
	}

	/* virtual methods from class ChunkHandler */
	void OnChunk(ContentSourcePtr source,
		     uint_least64_t offset) noexcept override {
		EXPECT_EQ(chunks_state, State::WAITING);

		auto &chunk = *chunks.emplace_back(std::make_unique<Chunk>());
		chunk.length = source->GetLength();
		chunk.offset = offset;
		chunk.source = std::move(source);

		EXPECT_FALSE(chunk.source->IsReproducible());

		if (consume)
			Consume(chunk);
	}

	void OnChunksEnd() noexcept override {
		EXPECT_EQ(chunks_state, State::WAITING);
		chunks_state = State::END;
	}

	void OnChunksError(std::exception_ptr error) noexcept override {
		EXPECT_EQ(chunks_state, State::WAITING);
		chunks_state = State::ERROR;
		chunks_error = std::move(error);
	}

	/* virtual methods from class SplitCompletionHandler */
	void OnSplitComplete() noexcept override {
		EXPECT_EQ(completion_state, State::WAITING);
		completion_state = State::END;
	}

	void OnSplitError(std::exception_ptr error) noexcept override {
		EXPECT_EQ(completion_state, State::WAITING);
		completion_state = State::ERROR;
		completion_error = std::move(error);
	}
};

/**
 * Samples ContentSplitter::GetBufferedBytes() after each delivery of
 * the parent.
 */
struct BufferedBytesMonitor final : ProgressHandler {
	ContentSplitter *splitter = nullptr;

	std::size_t max_buffered = 0;

	void OnProgress(std::size_t) noexcept override {
		max_buffered = std::max(max_buffered,
					splitter->GetBufferedBytes());
	}
};

BodyErrorCode
CatchBodyErrorCode(auto &&f)
{
	try {
		f();
	} catch (const BodyError &e) {
		return e.GetCode();
	}

	ADD_FAILURE() << "No BodyError thrown";
	return BodyErrorCode::UPSTREAM;
}

/**
 * Provides a #ThreadQueue with one worker thread for parents which
 * produce data in another thread.
 */
class SplitThreadTest : public ::testing::Test {
protected:
	EventLoop event_loop;

	ThreadQueue *queue = nullptr;

	struct thread_worker worker;

	void SetUp() override {
		queue = thread_queue_new(event_loop);
		thread_worker_create(worker, *queue);
	}

	void TearDown() override {
		thread_queue_stop(*queue);
		thread_worker_join(worker);
		thread_queue_free(queue);
	}
};

} // anonymous namespace

TEST(Split, KnownLength)
{
	EventLoop event_loop;

	auto parent = NewStringContentSource(event_loop, "hello world!");
	auto splitter = SplitContent(event_loop, *parent, 5, 1024);

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();

	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.GetOffsets(), (std::vector<uint_least64_t>{0, 5, 10}));
	EXPECT_EQ(collector.GetLengths(), (std::vector<uint_least64_t>{5, 5, 2}));
	EXPECT_EQ(collector.chunks[0]->handler.data, "hello");
	EXPECT_EQ(collector.chunks[1]->handler.data, " worl");
	EXPECT_EQ(collector.chunks[2]->handler.data, "d!");
	EXPECT_EQ(splitter->GetNextChunkOffset(), 12U);
	EXPECT_EQ(splitter->GetBufferedBytes(), 0U);
}

TEST(Split, KnownLengthEvenlyDivisible)
{
	EventLoop event_loop;

	auto parent = NewStringContentSource(event_loop, "0123456789");
	auto splitter = SplitContent(event_loop, *parent, 5, 1024);

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();

	EXPECT_EQ(collector.completion_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.GetLengths(), (std::vector<uint_least64_t>{5, 5}));
	EXPECT_EQ(collector.GetData(), "0123456789");
}

/**
 * With a known length, the memory ceiling may be smaller than the
 * chunk size; data streams through the chunks.
 */
TEST(Split, KnownLengthSmallCeiling)
{
	EventLoop event_loop;

	BufferedBytesMonitor monitor;
	auto parent = NewProgressContentSource(event_loop,
					       NewStringContentSource(event_loop,
								      "abcdefghijklmnopq"),
					       monitor);
	auto splitter = SplitContent(event_loop, *parent, 8, 3);
	monitor.splitter = splitter.get();

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();

	EXPECT_EQ(collector.completion_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.GetLengths(), (std::vector<uint_least64_t>{8, 8, 1}));
	EXPECT_EQ(collector.GetData(), "abcdefghijklmnopq");
	EXPECT_GT(monitor.max_buffered, 0U);
	EXPECT_LE(monitor.max_buffered, 3U);
}

TEST(Split, UnknownLength)
{
	EventLoop event_loop;

	BufferedBytesMonitor monitor;
	auto parent = NewProgressContentSource(event_loop,
					       std::make_unique<ScriptedSource>(event_loop,
										std::vector<std::string>{"abc", "defg", "hijklm"},
										std::nullopt),
					       monitor);
	auto splitter = SplitContent(event_loop, *parent, 5, 5);
	monitor.splitter = splitter.get();

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();

	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.GetOffsets(), (std::vector<uint_least64_t>{0, 5, 10}));
	EXPECT_EQ(collector.GetLengths(), (std::vector<uint_least64_t>{5, 5, 3}));
	EXPECT_EQ(collector.chunks[0]->handler.data, "abcde");
	EXPECT_EQ(collector.chunks[1]->handler.data, "fghij");
	EXPECT_EQ(collector.chunks[2]->handler.data, "klm");

	for (const auto &i : collector.chunks)
		EXPECT_EQ(i->handler.state, RecordingContentHandler::State::END);

	EXPECT_LE(monitor.max_buffered, 5U);
}

/**
 * Chunks are emitted only on demand.
 */
TEST(Split, ChunkDemand)
{
	EventLoop event_loop;

	auto parent = NewStringContentSource(event_loop, "hello world!");
	auto splitter = SplitContent(event_loop, *parent, 5, 1024);

	ChunkCollector collector;
	splitter->Subscribe(collector);

	/* nothing happens before the first request */
	event_loop.Dispatch();
	EXPECT_TRUE(collector.chunks.empty());

	splitter->Request(1);
	event_loop.Dispatch();
	EXPECT_EQ(collector.chunks.size(), 1U);
	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::WAITING);

	splitter->Request(2);
	event_loop.Dispatch();
	EXPECT_EQ(collector.chunks.size(), 3U);
	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.GetData(), "hello world!");
}

TEST(Split, InvalidArguments)
{
	EventLoop event_loop;

	ScriptedSource parent(event_loop, {"abc"}, std::nullopt);
	auto known = NewStringContentSource(event_loop, "abc");

	EXPECT_EQ(CatchBodyErrorCode([&]{
		SplitContent(event_loop, *known, 0, 10);
	}), BodyErrorCode::INVALID_ARGUMENT);

	EXPECT_EQ(CatchBodyErrorCode([&]{
		SplitContent(event_loop, *known, 10, 0);
	}), BodyErrorCode::INVALID_ARGUMENT);

	/* with unknown length, a whole chunk must fit into memory */
	EXPECT_EQ(CatchBodyErrorCode([&]{
		SplitContent(event_loop, parent, 10, 5);
	}), BodyErrorCode::INVALID_ARGUMENT);

	/* the parent was not touched */
	EXPECT_EQ(parent.GetSubscriptionCount(), 0U);

	/* with known length, it doesn't need to */
	EXPECT_NO_THROW(SplitContent(event_loop, *known, 10, 5));
}

TEST(Split, Empty)
{
	EventLoop event_loop;

	auto parent = NewEmptyContentSource(event_loop);
	auto splitter = SplitContent(event_loop, *parent, 5, 5);

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(1);
	event_loop.Dispatch();

	EXPECT_TRUE(collector.chunks.empty());
	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::END);
}

TEST(Split, EmptyUnknownLength)
{
	EventLoop event_loop;

	ScriptedSource parent(event_loop, {}, std::nullopt);
	auto splitter = SplitContent(event_loop, parent, 5, 5);

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(1);
	event_loop.Dispatch();

	EXPECT_TRUE(collector.chunks.empty());
	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::END);
}

/**
 * The parent fails after the first chunk has been delivered.  That
 * chunk remains valid, and no further chunk is emitted.
 */
TEST(Split, UpstreamFailure)
{
	EventLoop event_loop;

	ScriptedSource parent(event_loop, {"hello", "wor"}, std::nullopt,
			      std::make_exception_ptr(std::runtime_error("Connection reset")));
	auto splitter = SplitContent(event_loop, parent, 5, 5);

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();

	ASSERT_EQ(collector.chunks.size(), 1U);
	EXPECT_EQ(collector.chunks[0]->handler.state,
		  RecordingContentHandler::State::END);
	EXPECT_EQ(collector.chunks[0]->handler.data, "hello");

	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::ERROR);
	EXPECT_EQ(GetBodyErrorCode(collector.chunks_error),
		  BodyErrorCode::UPSTREAM);

	EXPECT_EQ(collector.completion_state, ChunkCollector::State::ERROR);
	EXPECT_EQ(GetBodyErrorCode(collector.completion_error),
		  BodyErrorCode::UPSTREAM);
	EXPECT_EQ(GetFullMessage(collector.completion_error),
		  "Parent content has failed: Connection reset");
}

/**
 * The parent fails while a chunk with known length is being
 * consumed; that chunk fails, too.
 */
TEST(Split, UpstreamFailureInChunk)
{
	EventLoop event_loop;

	ScriptedSource parent(event_loop, {"hello", "wor"}, 10,
			      std::make_exception_ptr(std::runtime_error("Connection reset")));
	auto splitter = SplitContent(event_loop, parent, 5, 5);

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();

	ASSERT_EQ(collector.chunks.size(), 2U);
	EXPECT_EQ(collector.chunks[0]->handler.state,
		  RecordingContentHandler::State::END);
	EXPECT_EQ(collector.chunks[0]->handler.data, "hello");
	EXPECT_EQ(collector.chunks[1]->handler.state,
		  RecordingContentHandler::State::ERROR);
	EXPECT_EQ(GetBodyErrorCode(collector.chunks[1]->handler.error),
		  BodyErrorCode::UPSTREAM);

	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::ERROR);
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::ERROR);
}

TEST(Split, ParentTooShort)
{
	EventLoop event_loop;

	ScriptedSource parent(event_loop, {"hello"}, 8);
	auto splitter = SplitContent(event_loop, parent, 5, 1024);

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();

	EXPECT_EQ(collector.completion_state, ChunkCollector::State::ERROR);
	EXPECT_EQ(GetBodyErrorCode(collector.completion_error),
		  BodyErrorCode::INVALID_LENGTH);
}

TEST(Split, ParentTooLong)
{
	EventLoop event_loop;

	ScriptedSource parent(event_loop, {"hello", "world"}, 8);
	auto splitter = SplitContent(event_loop, parent, 5, 1024);

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();

	EXPECT_EQ(collector.completion_state, ChunkCollector::State::ERROR);
	EXPECT_EQ(GetBodyErrorCode(collector.completion_error),
		  BodyErrorCode::INVALID_LENGTH);
}

/**
 * The completion is reported only after all chunks have been
 * consumed, not when they have been emitted.
 */
TEST(Split, CompletionAfterConsumption)
{
	EventLoop event_loop;

	auto parent = NewStringContentSource(event_loop, "hello world!");
	auto splitter = SplitContent(event_loop, *parent, 5, 1024);

	ChunkCollector collector;
	collector.consume = false;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();

	ASSERT_EQ(collector.chunks.size(), 3U);
	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::WAITING);
	EXPECT_EQ(splitter->GetBufferedBytes(), 12U);
	EXPECT_EQ(splitter->GetTrackedChunkCount(), 3U);

	/* consume in reverse order */
	collector.Consume(*collector.chunks[2]);
	collector.Consume(*collector.chunks[1]);
	event_loop.Dispatch();
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::WAITING);
	EXPECT_EQ(splitter->GetBufferedBytes(), 5U);

	/* the oldest chunk is still unfinished */
	EXPECT_EQ(splitter->GetTrackedChunkCount(), 3U);

	collector.Consume(*collector.chunks[0]);
	event_loop.Dispatch();
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.GetData(), "hello world!");
	EXPECT_EQ(splitter->GetBufferedBytes(), 0U);
	EXPECT_EQ(splitter->GetTrackedChunkCount(), 0U);
}

/**
 * Chunks which have been consumed are forgotten, so the splitter's
 * state does not grow with the parent's length.
 */
TEST(Split, FinishedChunksReleased)
{
	EventLoop event_loop;

	const std::string data(4096, 'x');
	auto parent = NewStringContentSource(event_loop, data);
	auto splitter = SplitContent(event_loop, *parent, 16, 64);

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();

	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.chunks.size(), 256U);
	EXPECT_EQ(collector.GetData(), data);
	EXPECT_EQ(splitter->GetNextChunkOffset(), 4096U);
	EXPECT_EQ(splitter->GetTrackedChunkCount(), 0U);
}

/**
 * A huge length with a small chunk size does not allocate anything
 * per chunk up front.
 */
TEST(Split, HugeKnownLength)
{
	EventLoop event_loop;

	ScriptedSource parent(event_loop, {"hello"}, uint_least64_t(1) << 36);
	auto splitter = SplitContent(event_loop, parent, 16, 1024);
	EXPECT_EQ(splitter->GetTrackedChunkCount(), 0U);

	ChunkCollector collector;
	collector.consume = false;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(2);
	event_loop.Dispatch();

	/* the parent ends much too early */
	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::ERROR);
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::ERROR);
	EXPECT_EQ(GetBodyErrorCode(collector.completion_error),
		  BodyErrorCode::INVALID_LENGTH);
	EXPECT_LE(splitter->GetTrackedChunkCount(), 2U);
}

/**
 * A chunk which is destroyed without being consumed fails the
 * split.
 */
TEST(Split, AbandonedChunk)
{
	EventLoop event_loop;

	auto parent = NewStringContentSource(event_loop, "hello world!");
	auto splitter = SplitContent(event_loop, *parent, 5, 1024);

	ChunkCollector collector;
	collector.consume = false;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(1);
	event_loop.Dispatch();

	ASSERT_EQ(collector.chunks.size(), 1U);
	collector.chunks.front()->source.reset();
	event_loop.Dispatch();

	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::ERROR);
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::ERROR);
	EXPECT_EQ(GetBodyErrorCode(collector.completion_error),
		  BodyErrorCode::CANCELLED);
}

TEST(Split, Cancel)
{
	EventLoop event_loop;

	ScriptedSource parent(event_loop, {"hello", "world", "foo"},
			      std::nullopt);
	auto splitter = SplitContent(event_loop, parent, 5, 5);

	ChunkCollector collector;
	collector.consume = false;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();

	ASSERT_EQ(collector.chunks.size(), 1U);

	splitter->Cancel();
	event_loop.Dispatch();

	/* no more ChunkHandler calls after Cancel() */
	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::WAITING);
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::ERROR);
	EXPECT_EQ(GetBodyErrorCode(collector.completion_error),
		  BodyErrorCode::CANCELLED);

	/* a chunk which was received completely remains valid */
	collector.Consume(*collector.chunks[0]);
	event_loop.Dispatch();
	EXPECT_EQ(collector.chunks[0]->handler.state,
		  RecordingContentHandler::State::END);
	EXPECT_EQ(collector.chunks[0]->handler.data, "hello");
}

TEST(Split, ZeroDemand)
{
	EventLoop event_loop;

	auto parent = NewStringContentSource(event_loop, "hello");
	auto splitter = SplitContent(event_loop, *parent, 5, 5);

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(0);
	event_loop.Dispatch();

	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::ERROR);
	EXPECT_EQ(GetBodyErrorCode(collector.chunks_error),
		  BodyErrorCode::PROTOCOL_VIOLATION);
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::ERROR);
}

TEST(Split, SubscribeTwice)
{
	EventLoop event_loop;

	auto parent = NewStringContentSource(event_loop, "hello");
	auto splitter = SplitContent(event_loop, *parent, 5, 5);

	ChunkCollector first, second;
	splitter->Subscribe(first);

	EXPECT_EQ(CatchBodyErrorCode([&]{
		splitter->Subscribe(second);
	}), BodyErrorCode::NOT_REPRODUCIBLE);
}

/**
 * Chunks are single-use sources.
 */
TEST(Split, ChunkNotReproducible)
{
	EventLoop event_loop;

	auto parent = NewStringContentSource(event_loop, "hello");
	auto splitter = SplitContent(event_loop, *parent, 5, 5);

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(1);
	event_loop.Dispatch();

	ASSERT_EQ(collector.chunks.size(), 1U);

	RecordingContentHandler other;
	EXPECT_EQ(CatchBodyErrorCode([&]{
		other.Subscribe(*collector.chunks[0]->source);
	}), BodyErrorCode::NOT_REPRODUCIBLE);

	EXPECT_EQ(collector.completion_state, ChunkCollector::State::END);
}

/**
 * Chunks survive the destruction of the splitter.
 */
TEST(Split, ChunkOutlivesSplitter)
{
	EventLoop event_loop;

	auto parent = NewStringContentSource(event_loop, "hello world!");
	auto splitter = SplitContent(event_loop, *parent, 5, 1024);

	ChunkCollector collector;
	collector.consume = false;
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();

	ASSERT_EQ(collector.chunks.size(), 3U);

	splitter.reset();

	for (auto &i : collector.chunks)
		collector.Consume(*i);

	event_loop.Dispatch();
	EXPECT_EQ(collector.GetData(), "hello world!");
}

/**
 * The parent is written synchronously by another thread.
 */
TEST_F(SplitThreadTest, BlockingOutput)
{
	BufferedBytesMonitor monitor;
	auto output = std::make_unique<BlockingOutputSource>(event_loop,
							     std::nullopt,
							     64, 10s);
	auto &sink = *output;
	auto parent = NewProgressContentSource(event_loop, std::move(output),
					       monitor);
	auto splitter = SplitContent(event_loop, *parent, 5, 5);
	monitor.splitter = splitter.get();

	std::exception_ptr writer_error;
	std::thread writer([&]{
		try {
			sink.Write(AsBytes("abc"));
			sink.Write(AsBytes("defg"));
			sink.Write(AsBytes("hijklm"));
			sink.Close();
		} catch (...) {
			writer_error = std::current_exception();
		}
	});

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();
	writer.join();

	EXPECT_FALSE(writer_error);
	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.GetLengths(), (std::vector<uint_least64_t>{5, 5, 3}));
	EXPECT_EQ(collector.GetData(), "abcdefghijklm");
	EXPECT_LE(monitor.max_buffered, 5U);
}

/**
 * The parent is read by a worker thread, and the memory ceiling is
 * smaller than both the chunk size and the read buffer.
 */
TEST_F(SplitThreadTest, FileSmallCeiling)
{
	const TempFile file("abcdefghijklmnopq");

	BufferedBytesMonitor monitor;
	auto parent = NewProgressContentSource(event_loop,
					       NewFileContentSource(event_loop,
								    *queue,
								    file.c_str(),
								    4),
					       monitor);
	auto splitter = SplitContent(event_loop, *parent, 8, 3);
	monitor.splitter = splitter.get();

	ChunkCollector collector;
	splitter->SetCompletionHandler(collector);
	splitter->Subscribe(collector);
	splitter->Request(ContentSubscription::UNBOUNDED_DEMAND);
	event_loop.Dispatch();

	EXPECT_EQ(collector.chunks_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.completion_state, ChunkCollector::State::END);
	EXPECT_EQ(collector.GetLengths(), (std::vector<uint_least64_t>{8, 8, 1}));
	EXPECT_EQ(collector.GetData(), "abcdefghijklmnopq");
	EXPECT_GT(monitor.max_buffered, 0U);
	EXPECT_LE(monitor.max_buffered, 3U);
	EXPECT_EQ(splitter->GetTrackedChunkCount(), 0U);
}
