// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "body/Error.hxx"

#include <fmt/format.h>

#include <atomic>

#include <stdio.h>

static std::atomic_uint log_level{2};

void
SetLogLevel(unsigned level) noexcept
{
	log_level.store(level, std::memory_order_relaxed);
}

unsigned
GetLogLevel() noexcept
{
	return log_level.load(std::memory_order_relaxed);
}

void
LogMessage(unsigned level, std::string_view domain,
	   std::string_view msg) noexcept
{
	if (!IsLogLevelVisible(level))
		return;

	/* one fprintf() call per line keeps lines from different
	   threads from interleaving */
	fprintf(stderr, "[%.*s] %.*s\n",
		int(domain.size()), domain.data(),
		int(msg.size()), msg.data());
}

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
try {
	const auto msg = fmt::vformat(format_str, args);
	LogMessage(level, domain, msg);
} catch (const std::exception &e) {
	LogMessage(1, domain, e.what());
}

void
LLogger::operator()(unsigned level, std::string_view prefix,
		    std::exception_ptr ep) const noexcept
{
	if (IsLogLevelVisible(level))
		LogFmt(level, domain, "{}{}", prefix, GetFullMessage(ep));
}
