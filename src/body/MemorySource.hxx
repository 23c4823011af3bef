// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Content sources which deliver data from memory.  All of them are
 * reproducible and have a known length.
 */

#pragma once

#include "Source.hxx"

#include <cstddef>
#include <span>
#include <string_view>

class EventLoop;

/**
 * A source with no data; a subscription finishes without any
 * delivery, even if no demand is granted.
 */
ContentSourcePtr
NewEmptyContentSource(EventLoop &event_loop) noexcept;

/**
 * Deliver a copy of the given buffer.  Later modifications of the
 * caller's buffer have no effect.
 */
ContentSourcePtr
NewCopiedContentSource(EventLoop &event_loop,
		       std::span<const std::byte> src) noexcept;

/**
 * Deliver the given buffer without copying it.  The caller is
 * responsible for keeping it alive and unmodified for as long as any
 * subscription exists.
 */
ContentSourcePtr
NewUnsafeContentSource(EventLoop &event_loop,
		       std::span<const std::byte> src) noexcept;

/**
 * Deliver a copy of the bytes between the given read position and
 * the end of the buffer.
 */
ContentSourcePtr
NewRemainingContentSource(EventLoop &event_loop,
			  std::span<const std::byte> buffer,
			  std::size_t position) noexcept;

/**
 * Like NewRemainingContentSource(), but without copying.
 */
ContentSourcePtr
NewUnsafeRemainingContentSource(EventLoop &event_loop,
				std::span<const std::byte> buffer,
				std::size_t position) noexcept;

/**
 * Deliver a copy of all given buffers in order, one delivery per
 * buffer (unless the handler accepts only a part of one).
 */
ContentSourcePtr
NewMultiContentSource(EventLoop &event_loop,
		      std::span<const std::span<const std::byte>> buffers) noexcept;

/**
 * Like NewMultiContentSource(), but without copying.
 */
ContentSourcePtr
NewUnsafeMultiContentSource(EventLoop &event_loop,
			    std::span<const std::span<const std::byte>> buffers) noexcept;

/**
 * Deliver a copy of the given string.
 *
 * @param content_type the announced content type; the caller
 * declares the charset the string is encoded in
 */
ContentSourcePtr
NewStringContentSource(EventLoop &event_loop, std::string_view s,
		       std::string_view content_type=REQBODY_MIMETYPE_TEXT_PLAIN_UTF8) noexcept;
