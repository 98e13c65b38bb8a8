// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Exception.hxx"

#include <fmt/format.h>

#include <string_view>
#include <utility>

/**
 * Levels:
 *
 * - 1 = errors
 * - 2 = important events (child process started/exited)
 * - 3 = informational (facts discovered, unit locked)
 * - 4, 5 = debugging
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

[[gnu::pure]]
inline bool
CheckLogLevel(unsigned level) noexcept
{
	return level <= GetLogLevel();
}

/**
 * Write one line to stderr.
 */
void
LogLine(std::string_view domain, std::string_view msg);

/**
 * A logger with a fixed domain string which is prepended to all
 * messages.
 */
class Logger {
	const std::string_view domain;

public:
	explicit constexpr Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	template<typename... Args>
	void operator()(unsigned level, Args&&... args) const {
		if (!CheckLogLevel(level))
			return;

		fmt::memory_buffer buffer;
		(fmt::format_to(std::back_inserter(buffer), "{}",
				std::forward<Args>(args)), ...);
		LogLine(domain, {buffer.data(), buffer.size()});
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const {
		if (!CheckLogLevel(level))
			return;

		LogLine(domain, fmt::format(format_str,
					    std::forward<Args>(args)...));
	}
};
