// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Split.hxx"
#include "Subscription.hxx"
#include "Error.hxx"

#include <algorithm>
#include <cassert>
#include <vector>

class ChunkSubscription;

/**
 * The state of one chunk, shared between the #ContentSplitter, the
 * chunk's #ContentSource and its #ContentSubscription.  Chunks may
 * outlive the #ContentSplitter.
 */
struct SplitChunk {
	/**
	 * nullptr after the #ContentSplitter has been destroyed.
	 */
	ContentSplitter *splitter;

	const uint_least64_t offset;

	/**
	 * The (maximum) size of this chunk.  If the parent's length is
	 * unknown, this is updated when the chunk is sealed.
	 */
	uint_least64_t size;

	/**
	 * The number of bytes received from the parent.
	 */
	uint_least64_t received = 0;

	/**
	 * Received data which has not been consumed yet.
	 */
	std::vector<std::byte> pending;
	std::size_t pending_position = 0;

	ChunkSubscription *subscription = nullptr;

	/**
	 * If set, this chunk has failed before it was received
	 * completely.
	 */
	std::exception_ptr error;

	/**
	 * Have all bytes of this chunk been received?
	 */
	bool sealed = false;

	/**
	 * Has Subscribe() been called?  Chunks are single-use.
	 */
	bool subscribed = false;

	/**
	 * Has all data been consumed?
	 */
	bool finished = false;

	SplitChunk(ContentSplitter &_splitter,
		   uint_least64_t _offset, uint_least64_t _size) noexcept
		:splitter(&_splitter), offset(_offset), size(_size) {}

	std::span<const std::byte> GetPending() const noexcept {
		return std::span{pending}.subspan(pending_position);
	}

	std::size_t GetRoom() const noexcept {
		return size - received;
	}

	/**
	 * Copy parent data into this chunk.  The parent's buffer is
	 * only valid during OnContentData(), but the chunk consumer
	 * may ask for it much later.
	 */
	void Append(std::span<const std::byte> src) noexcept {
		assert(!sealed);
		assert(src.size() <= GetRoom());

		if (pending_position == pending.size()) {
			pending.clear();
			pending_position = 0;
		}

		pending.insert(pending.end(), src.begin(), src.end());
		received += src.size();
		if (received == size)
			sealed = true;
	}

	void Seal() noexcept {
		assert(!sealed);
		assert(received > 0);

		size = received;
		sealed = true;
	}

	void Consume(std::size_t nbytes) noexcept {
		assert(nbytes <= GetPending().size());

		pending_position += nbytes;
		if (pending_position == pending.size()) {
			pending.clear();
			pending.shrink_to_fit();
			pending_position = 0;
		}
	}

	/**
	 * Drop pending data and return its size.
	 */
	std::size_t Discard() noexcept {
		const std::size_t result = GetPending().size();
		pending.clear();
		pending.shrink_to_fit();
		pending_position = 0;
		return result;
	}

	/**
	 * Wake up the subscription, if there is one.
	 */
	void Wake() noexcept;

	void Fail(std::exception_ptr ep) noexcept {
		assert(!sealed);

		if (!error) {
			error = std::move(ep);
			Wake();
		}
	}
};

class ChunkSubscription final : public ContentSubscription {
	const std::shared_ptr<SplitChunk> chunk;

public:
	ChunkSubscription(EventLoop &event_loop, ContentHandler &_handler,
			  std::shared_ptr<SplitChunk> _chunk) noexcept
		:ContentSubscription(event_loop, _handler, _chunk->size),
		 chunk(std::move(_chunk))
	{
		assert(chunk->subscription == nullptr);
		chunk->subscription = this;

		if (chunk->error)
			/* report the error without waiting for demand */
			ScheduleProduce();
	}

	~ChunkSubscription() noexcept override {
		chunk->subscription = nullptr;
	}

	void Wake() noexcept {
		ScheduleProduce();
	}

protected:
	/* virtual methods from class ContentSubscription */
	void _Produce() noexcept override;
	void _Cancel() noexcept override;
};

inline void
SplitChunk::Wake() noexcept
{
	if (subscription != nullptr)
		subscription->Wake();
}

void
ChunkSubscription::_Produce() noexcept
{
	if (chunk->error) {
		DestroyError(chunk->error);
		return;
	}

	while (true) {
		const auto r = chunk->GetPending();
		if (r.empty())
			break;

		if (!HasDemand())
			return;

		const std::size_t nbytes = Deliver(r);
		if (nbytes == 0)
			return;

		chunk->Consume(nbytes);
		if (chunk->splitter != nullptr)
			chunk->splitter->OnChunkConsumed(nbytes);

		if (nbytes < r.size())
			/* the handler is full; wait for more demand */
			return;
	}

	if (!chunk->sealed)
		/* wait for more data from the parent */
		return;

	/* the handler may destroy the splitter and the chunk source;
	   keep a reference to the chunk */
	const auto c = chunk;
	c->finished = true;
	DestroyEof();

	if (c->splitter != nullptr)
		c->splitter->OnChunkFinished();
}

void
ChunkSubscription::_Cancel() noexcept
{
	const auto c = chunk;
	Destroy();

	if (!c->finished && c->splitter != nullptr)
		c->splitter->OnChunkAbandoned();
}

class ChunkContentSource final : public ContentSource {
	EventLoop &event_loop;

	const std::shared_ptr<SplitChunk> chunk;

public:
	ChunkContentSource(EventLoop &_event_loop,
			   std::shared_ptr<SplitChunk> _chunk) noexcept
		:event_loop(_event_loop), chunk(std::move(_chunk)) {}

	~ChunkContentSource() noexcept override {
		if (!chunk->subscribed && chunk->splitter != nullptr)
			chunk->splitter->OnChunkAbandoned();
	}

	/* virtual methods from class ContentPublisher */
	ContentSubscription &Subscribe(ContentHandler &handler) override {
		if (chunk->subscribed)
			throw BodyError(BodyErrorCode::NOT_REPRODUCIBLE,
					"A chunk can be consumed only once");

		auto &s = *new ChunkSubscription(event_loop, handler, chunk);
		chunk->subscribed = true;
		return s;
	}

	bool IsReproducible() const noexcept override {
		return false;
	}

	/* virtual methods from class ContentSource */
	std::optional<uint_least64_t> GetLength() const noexcept override {
		return chunk->size;
	}
};

ContentSplitter::ContentSplitter(EventLoop &_event_loop,
				 ContentSource &_parent,
				 std::size_t _chunk_size,
				 std::size_t _memory_ceiling) noexcept
	:event_loop(_event_loop), parent(_parent),
	 chunk_size(_chunk_size), memory_ceiling(_memory_ceiling),
	 length(parent.GetLength()),
	 logger("split"),
	 defer_emit(event_loop, [this]{ OnDeferredEmit(); }),
	 defer_complete(event_loop, [this]{ OnDeferredComplete(); })
{
	if (IsKnownLength() && *length == 0)
		/* nothing to read */
		parent_end = true;
}

ContentSplitter::~ContentSplitter() noexcept
{
	const auto ep = std::make_exception_ptr(BodyError(BodyErrorCode::CANCELLED,
							  "The splitter has been destroyed"));

	for (auto &i : chunks) {
		i->splitter = nullptr;

		if (!i->sealed)
			i->Fail(ep);
	}
}

void
ContentSplitter::Subscribe(ChunkHandler &handler)
{
	if (chunk_subscribed)
		throw BodyError(BodyErrorCode::NOT_REPRODUCIBLE,
				"The chunks can be consumed only once");

	chunk_subscribed = true;
	chunk_handler = &handler;
}

void
ContentSplitter::Request(uint_least64_t n) noexcept
{
	assert(chunk_handler != nullptr);

	if (n == 0) {
		Fail(std::make_exception_ptr(BodyError(BodyErrorCode::PROTOCOL_VIOLATION,
						       "Non-positive chunk demand requested")));
		return;
	}

	if (n >= UINT_LEAST64_MAX - chunk_demand)
		chunk_demand = UINT_LEAST64_MAX;
	else
		chunk_demand += n;

	StartParent();
	defer_emit.Schedule();
}

void
ContentSplitter::Cancel() noexcept
{
	/* no more ChunkHandler calls */
	chunk_handler = nullptr;
	chunks_end = true;

	Fail(std::make_exception_ptr(BodyError(BodyErrorCode::CANCELLED,
					       "Chunk consumer has cancelled")));
}

void
ContentSplitter::SetCompletionHandler(SplitCompletionHandler &handler) noexcept
{
	completion_handler = &handler;

	if (failed || IsComplete())
		defer_complete.Schedule();
}

void
ContentSplitter::StartParent() noexcept
{
	if (parent_started || failed)
		return;

	parent_started = true;

	if (parent_end)
		/* empty parent */
		return;

	if (IsKnownLength())
		logger.Fmt(4, "Splitting {} bytes into chunks of {} bytes",
			   *length, chunk_size);
	else
		logger.Fmt(4, "Splitting content of unknown length into chunks of {} bytes",
			   chunk_size);

	try {
		SetInput(parent);
	} catch (...) {
		Fail(std::current_exception());
		return;
	}

	RequestParent();
}

void
ContentSplitter::RequestParent() noexcept
{
	if (!HasInput() || parent_requested ||
	    buffered_bytes >= memory_ceiling)
		return;

	parent_requested = true;
	input.Request(1);
}

SplitChunk &
ContentSplitter::MakeChunk() noexcept
{
	uint_least64_t offset, size = chunk_size;
	if (IsKnownLength()) {
		/* may be ahead of the intake */
		offset = n_created * chunk_size;
		size = std::min<uint_least64_t>(size, *length - offset);
	} else
		/* all previous chunks are sealed */
		offset = intake_offset;

	chunks.emplace_back(std::make_shared<SplitChunk>(*this, offset, size));
	++n_created;
	return *chunks.back();
}

void
ContentSplitter::RemoveFinishedChunks() noexcept
{
	while (!chunks.empty() && chunks.front()->finished) {
		/* the chunk doesn't call us anymore */
		chunks.front()->splitter = nullptr;
		chunks.pop_front();
		++n_removed;
	}
}

SplitChunk &
ContentSplitter::GetIntakeChunk() noexcept
{
	/* finished chunks are sealed */
	intake_index = std::max(intake_index, n_removed);

	/* with known length, chunks may have been created (and
	   emitted) ahead of the intake */
	while (intake_index < n_created && GetChunk(intake_index)->sealed)
		++intake_index;

	if (intake_index == n_created)
		return MakeChunk();

	return *GetChunk(intake_index);
}

std::shared_ptr<SplitChunk>
ContentSplitter::GetEmittableChunk() noexcept
{
	if (n_emitted < n_created) {
		const auto &chunk = GetChunk(n_emitted);

		/* with unknown length, the chunk size is not known
		   before it is sealed */
		if (IsKnownLength() || chunk->sealed)
			return chunk;

		return nullptr;
	}

	if (IsKnownLength() && n_emitted < GetChunkCount()) {
		/* not received yet, but its range is known */
		MakeChunk();
		return chunks.back();
	}

	return nullptr;
}

bool
ContentSplitter::IsChunkStreamFinished() const noexcept
{
	/* with known length, the chunk consumer learns about parent
	   failures until the last byte has arrived */
	return parent_end &&
		n_emitted == (IsKnownLength() ? GetChunkCount() : n_created);
}

void
ContentSplitter::Fail(std::exception_ptr ep) noexcept
{
	if (failed)
		return;

	failed = true;
	error = ep;

	logger(GetBodyErrorCode(ep) == BodyErrorCode::CANCELLED ? 4 : 2,
	       "Split failed: ", ep);

	CancelInput();

	for (auto &i : chunks) {
		if (!i->sealed) {
			buffered_bytes -= i->Discard();
			i->Fail(ep);
		}
	}

	defer_emit.Schedule();
	defer_complete.Schedule();
}

void
ContentSplitter::OnChunkConsumed(std::size_t nbytes) noexcept
{
	assert(nbytes <= buffered_bytes);

	buffered_bytes -= nbytes;
	RequestParent();
}

void
ContentSplitter::OnChunkFinished() noexcept
{
	assert(n_outstanding > 0);

	--n_outstanding;
	RemoveFinishedChunks();

	if (IsComplete())
		defer_complete.Schedule();
}

void
ContentSplitter::OnChunkAbandoned() noexcept
{
	Fail(std::make_exception_ptr(BodyError(BodyErrorCode::CANCELLED,
					       "A chunk was discarded before it was consumed")));
}

void
ContentSplitter::OnDeferredEmit() noexcept
{
	if (chunk_handler == nullptr || chunks_end)
		return;

	if (failed) {
		chunks_end = true;
		chunk_handler->OnChunksError(error);
		return;
	}

	if (IsChunkStreamFinished()) {
		chunks_end = true;

		if (IsComplete())
			defer_complete.Schedule();

		chunk_handler->OnChunksEnd();
		return;
	}

	if (chunk_demand == 0)
		return;

	auto chunk = GetEmittableChunk();
	if (chunk == nullptr)
		/* wait for more data from the parent */
		return;

	if (chunk_demand != UINT_LEAST64_MAX)
		--chunk_demand;

	++n_emitted;
	++n_outstanding;
	next_chunk_offset = chunk->offset + chunk->size;

	logger.Fmt(5, "Emitting chunk {}+{}", chunk->offset, chunk->size);

	const uint_least64_t offset = chunk->offset;
	auto source = std::make_unique<ChunkContentSource>(event_loop,
							   std::move(chunk));

	/* try to emit the next one (or the end) in the next
	   iteration */
	defer_emit.Schedule();

	chunk_handler->OnChunk(std::move(source), offset);
}

void
ContentSplitter::OnDeferredComplete() noexcept
{
	if (completion_handler == nullptr || completion_notified)
		return;

	if (failed) {
		completion_notified = true;
		completion_handler->OnSplitError(error);
	} else if (IsComplete()) {
		completion_notified = true;
		logger.Fmt(4, "Split complete after {} chunks", n_emitted);
		completion_handler->OnSplitComplete();
	}
}

std::size_t
ContentSplitter::OnContentData(std::span<const std::byte> src) noexcept
{
	assert(!failed);

	parent_requested = false;

	if (IsKnownLength() && src.size() > *length - intake_offset) {
		Fail(std::make_exception_ptr(FmtBodyError(BodyErrorCode::INVALID_LENGTH,
							  "Parent delivered more than {} bytes",
							  *length)));
		return 0;
	}

	std::size_t total = 0;
	bool sealed = false;

	while (!src.empty() && buffered_bytes < memory_ceiling) {
		auto &chunk = GetIntakeChunk();

		const std::size_t n = std::min({src.size(),
				memory_ceiling - buffered_bytes,
				chunk.GetRoom()});

		chunk.Append(src.first(n));
		buffered_bytes += n;
		intake_offset += n;
		total += n;
		src = src.subspan(n);

		if (chunk.sealed)
			sealed = true;

		chunk.Wake();
	}

	if (sealed)
		defer_emit.Schedule();

	RequestParent();
	return total;
}

void
ContentSplitter::OnContentEnd() noexcept
{
	ClearInput();
	parent_end = true;

	if (IsKnownLength()) {
		if (intake_offset != *length) {
			Fail(std::make_exception_ptr(FmtBodyError(BodyErrorCode::INVALID_LENGTH,
								  "Parent ended after {} of {} bytes",
								  intake_offset, *length)));
			return;
		}
	} else if (!chunks.empty() && !chunks.back()->sealed) {
		/* the remainder becomes the final chunk */
		chunks.back()->Seal();
	}

	defer_emit.Schedule();

	if (IsComplete())
		/* all chunks were consumed already */
		defer_complete.Schedule();
}

void
ContentSplitter::OnContentError(std::exception_ptr ep) noexcept
{
	ClearInput();
	Fail(NestUpstreamError(std::move(ep), "Parent content has failed"));
}

void
CheckSplitParameters(std::size_t chunk_size, std::size_t memory_ceiling,
		     bool length_known)
{
	if (chunk_size == 0)
		throw BodyError(BodyErrorCode::INVALID_ARGUMENT,
				"Chunk size must be positive");

	if (memory_ceiling == 0)
		throw BodyError(BodyErrorCode::INVALID_ARGUMENT,
				"Memory ceiling must be positive");

	if (!length_known && memory_ceiling < chunk_size)
		throw FmtBodyError(BodyErrorCode::INVALID_ARGUMENT,
				   "Memory ceiling ({} bytes) must not be smaller than the chunk size ({} bytes) if the content length is unknown",
				   memory_ceiling, chunk_size);
}

std::unique_ptr<ContentSplitter>
SplitContent(EventLoop &event_loop, ContentSource &parent,
	     std::size_t chunk_size, std::size_t memory_ceiling)
{
	CheckSplitParameters(chunk_size, memory_ceiling,
			     parent.GetLength().has_value());

	return std::make_unique<ContentSplitter>(event_loop, parent,
						 chunk_size, memory_ceiling);
}
