// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <cerrno>
#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

/**
 * Error codes for #BodyError.
 */
enum class BodyErrorCode {
	/**
	 * A size or length parameter was out of range (e.g. a zero
	 * chunk size).  Thrown synchronously, before production
	 * starts.
	 */
	INVALID_ARGUMENT,

	/**
	 * A caller-declared content length was negative or did not
	 * match the number of bytes actually produced.
	 */
	INVALID_LENGTH,

	/**
	 * A single-use content source was subscribed a second time.
	 */
	NOT_REPRODUCIBLE,

	/**
	 * The underlying medium (file, stream, network) has failed.
	 * The original error is nested.
	 */
	UPSTREAM,

	/**
	 * A producer or consumer has violated the delivery protocol,
	 * e.g. by delivering more chunks than requested.  This is a
	 * programming error; retrying will not help.
	 */
	PROTOCOL_VIOLATION,

	/**
	 * The peer has cancelled the operation.
	 */
	CANCELLED,
};

class BodyError : public std::runtime_error {
	BodyErrorCode code;

public:
	BodyError(BodyErrorCode _code, const char *_msg)
		:std::runtime_error(_msg), code(_code) {}

	BodyError(BodyErrorCode _code, const std::string &_msg)
		:std::runtime_error(_msg), code(_code) {}

	BodyErrorCode GetCode() const noexcept {
		return code;
	}
};

[[gnu::const]]
const char *
ToString(BodyErrorCode code) noexcept;

BodyError
VFmtBodyError(BodyErrorCode code,
	      fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
BodyError
FmtBodyError(BodyErrorCode code, const S &format_str, Args&&... args) noexcept
{
	return VFmtBodyError(code, format_str,
			     fmt::make_format_args(args...));
}

/**
 * Construct a std::system_error from the given errno value.
 */
std::system_error
MakeErrno(int code, const char *msg) noexcept;

/**
 * Like MakeErrno(int, const char *), but use the current errno
 * value.
 */
std::system_error
MakeErrno(const char *msg) noexcept;

template<typename S, typename... Args>
std::system_error
FmtErrno(const S &format_str, Args&&... args) noexcept
{
	const int e = errno;
	const auto msg = fmt::vformat(format_str,
				      fmt::make_format_args(args...));
	return MakeErrno(e, msg.c_str());
}

/**
 * Wrap the given exception in a #BodyError with code
 * #BodyErrorCode::UPSTREAM (unless it is already a #BodyError).
 * The original exception is nested.
 */
std::exception_ptr
NestUpstreamError(std::exception_ptr ep, const char *msg) noexcept;

/**
 * Determine the #BodyErrorCode of the given exception.  Exceptions
 * which are not #BodyError instances are classified as
 * #BodyErrorCode::UPSTREAM.
 */
[[gnu::pure]]
BodyErrorCode
GetBodyErrorCode(std::exception_ptr ep) noexcept;

/**
 * Is it worth retrying the transfer (with a fresh subscription of a
 * reproducible source) after this error?
 */
[[gnu::pure]]
bool
IsBodyErrorRetryable(std::exception_ptr ep) noexcept;

/**
 * Render the message of the given exception, including all nested
 * exceptions, separated by ": ".
 */
std::string
GetFullMessage(std::exception_ptr ep) noexcept;
