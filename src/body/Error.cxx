// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <errno.h>

const char *
ToString(BodyErrorCode code) noexcept
{
	switch (code) {
	case BodyErrorCode::INVALID_ARGUMENT:
		return "invalid argument";

	case BodyErrorCode::INVALID_LENGTH:
		return "invalid length";

	case BodyErrorCode::NOT_REPRODUCIBLE:
		return "not reproducible";

	case BodyErrorCode::UPSTREAM:
		return "upstream failure";

	case BodyErrorCode::PROTOCOL_VIOLATION:
		return "protocol violation";

	case BodyErrorCode::CANCELLED:
		return "cancelled";
	}

	return "unknown";
}

BodyError
VFmtBodyError(BodyErrorCode code,
	      fmt::string_view format_str, fmt::format_args args) noexcept
try {
	return BodyError(code, fmt::vformat(format_str, args));
} catch (const std::bad_alloc &) {
	return BodyError(code, ToString(code));
}

std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(std::error_code(code, std::system_category()),
				 msg);
}

std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

std::exception_ptr
NestUpstreamError(std::exception_ptr ep, const char *msg) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const BodyError &) {
		return ep;
	} catch (...) {
		try {
			std::throw_with_nested(BodyError(BodyErrorCode::UPSTREAM,
							 msg));
		} catch (...) {
			return std::current_exception();
		}
	}
}

BodyErrorCode
GetBodyErrorCode(std::exception_ptr ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const BodyError &e) {
		return e.GetCode();
	} catch (...) {
		return BodyErrorCode::UPSTREAM;
	}
}

bool
IsBodyErrorRetryable(std::exception_ptr ep) noexcept
{
	switch (GetBodyErrorCode(ep)) {
	case BodyErrorCode::UPSTREAM:
		return true;

	case BodyErrorCode::INVALID_ARGUMENT:
	case BodyErrorCode::INVALID_LENGTH:
	case BodyErrorCode::NOT_REPRODUCIBLE:
	case BodyErrorCode::PROTOCOL_VIOLATION:
	case BodyErrorCode::CANCELLED:
		break;
	}

	return false;
}

static void
AppendFullMessage(std::string &result, const std::exception &e) noexcept
{
	if (!result.empty())
		result += ": ";
	result += e.what();

	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		AppendFullMessage(result, nested);
	} catch (...) {
		result += ": Unrecognized nested exception";
	}
}

std::string
GetFullMessage(std::exception_ptr ep) noexcept
{
	std::string result;

	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		AppendFullMessage(result, e);
	} catch (...) {
		result = "Unrecognized exception";
	}

	return result;
}
