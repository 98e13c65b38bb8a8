// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * Reconstructs lines from a byte stream which has no framing.  Both
 * CR and LF terminate a line (ffmpeg uses CR to redraw its status
 * line), so "\r\n" yields an additional empty line.
 *
 * All data is raw bytes; decoding is left to the caller.
 */
class LineAccumulator {
	std::string buffer;

	/**
	 * All completed lines, oldest first.
	 */
	std::vector<std::string> history;

public:
	static constexpr bool IsTerminator(char ch) noexcept {
		return ch == '\r' || ch == '\n';
	}

	/**
	 * Append one byte.
	 *
	 * @return the completed line (without terminator) if the byte
	 * was a terminator; it is valid until the next modification
	 */
	std::optional<std::string_view> Feed(char ch);

	/**
	 * Complete the current buffer as if a terminator had been
	 * received.
	 */
	std::string_view ForceComplete();

	/**
	 * Complete the current buffer if it is not empty.  Call this at
	 * the end of the stream.
	 */
	std::optional<std::string_view> Flush();

	/**
	 * The bytes received since the last terminator.
	 */
	std::string_view GetPartial() const noexcept {
		return buffer;
	}

	const std::vector<std::string> &GetHistory() const noexcept {
		return history;
	}

	/**
	 * @return the most recently completed line or nullptr if there
	 * is none
	 */
	const std::string *GetLastLine() const noexcept {
		return history.empty() ? nullptr : &history.back();
	}
};
