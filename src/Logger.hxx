// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string>
#include <string_view>
#include <utility>

/**
 * Set the maximum level of messages which are printed.  1 means
 * errors only, 5 is everything including trace messages.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

[[gnu::pure]]
static inline bool
IsLogLevelVisible(unsigned level) noexcept
{
	return level <= GetLogLevel();
}

void
LogMessage(unsigned level, std::string_view domain,
	   std::string_view msg) noexcept;

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename S, typename... Args>
static inline void
LogFmt(unsigned level, std::string_view domain,
       const S &format_str, Args&&... args) noexcept
{
	if (IsLogLevelVisible(level))
		LogVFmt(level, domain, format_str,
			fmt::make_format_args(args...));
}

/**
 * A logger which prefixes all messages with a fixed domain name.
 */
class LLogger {
	std::string domain;

public:
	explicit LLogger(std::string_view _domain) noexcept
		:domain(_domain) {}

	std::string_view GetDomain() const noexcept {
		return domain;
	}

	void operator()(unsigned level, std::string_view msg) const noexcept {
		if (IsLogLevelVisible(level))
			LogMessage(level, domain, msg);
	}

	/**
	 * Log a message followed by the (nested) message of the given
	 * exception.
	 */
	void operator()(unsigned level, std::string_view prefix,
			std::exception_ptr ep) const noexcept;

	template<typename S, typename... Args>
	void Fmt(unsigned level, const S &format_str,
		 Args&&... args) const noexcept {
		LogFmt(level, domain, format_str,
		       std::forward<Args>(args)...);
	}
};
