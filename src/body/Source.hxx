// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "reqbody/Mimetype.hxx"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

class ContentHandler;
class ContentSubscription;

/**
 * Something which can be subscribed to.  This is the interface of an
 * externally driven producer which does not announce its length.
 */
class ContentPublisher {
public:
	virtual ~ContentPublisher() noexcept = default;

	/**
	 * Start a new production session.  Nothing is delivered before
	 * the handler calls ContentSubscription::Request().
	 *
	 * Throws #BodyError with #BodyErrorCode::NOT_REPRODUCIBLE if
	 * this is a single-use publisher which has been subscribed to
	 * already; other exceptions may be thrown if the session
	 * cannot be set up.
	 */
	virtual ContentSubscription &Subscribe(ContentHandler &handler) = 0;

	/**
	 * Can this object be subscribed to more than once, each time
	 * producing the same bytes?
	 */
	[[gnu::pure]]
	virtual bool IsReproducible() const noexcept = 0;
};

/**
 * A producer of request body content with an optional known total
 * length and a content type.
 */
class ContentSource : public ContentPublisher {
public:
	/**
	 * @return the total length in bytes, or std::nullopt if it is
	 * not known in advance; never changes after it has been
	 * reported
	 */
	[[gnu::pure]]
	virtual std::optional<uint_least64_t> GetLength() const noexcept = 0;

	[[gnu::pure]]
	virtual std::string_view GetContentType() const noexcept {
		return REQBODY_MIMETYPE_OCTET_STREAM;
	}
};

using ContentSourcePtr = std::unique_ptr<ContentSource>;
