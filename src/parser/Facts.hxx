// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <string>
#include <string_view>

class TextDecoder;

/*
 * Extractors for the facts ffmpeg prints to stderr.  Each one
 * searches the whole line (not anchored) and returns std::nullopt if
 * the pattern does not occur.
 */

/**
 * "Duration: HH:MM:SS.ff" (fraction truncated).
 */
[[gnu::pure]]
std::optional<unsigned>
ExtractDuration(std::string_view line) noexcept;

/**
 * "time=HH:MM:SS.ff" (fraction truncated).
 */
[[gnu::pure]]
std::optional<unsigned>
ExtractPosition(std::string_view line) noexcept;

/**
 * "from 'PATH':" where PATH extends to the last "':" of the line.
 *
 * @return the base name of PATH (raw bytes)
 */
[[gnu::pure]]
std::optional<std::string_view>
ExtractSource(std::string_view line) noexcept;

/**
 * "NN fps" or "NN.NN fps" from a stream description, rounded
 * half-to-even.  If there is none, the encoder status field "fps=N"
 * is used unless it is zero.
 */
[[gnu::pure]]
std::optional<unsigned>
ExtractFrameRate(std::string_view line) noexcept;

/**
 * Round a decimal given in hundredths to the nearest integer, ties
 * to the even neighbour.
 */
constexpr unsigned
RoundHalfEven(unsigned hundredths) noexcept
{
	unsigned result = hundredths / 100;
	const unsigned remainder = hundredths % 100;
	if (remainder > 50 || (remainder == 50 && result % 2 != 0))
		++result;
	return result;
}

/**
 * The facts about the media being encoded, collected from the
 * diagnostic stream during one run.  Each one is set by the first
 * line which contains it; later matches are ignored.
 */
struct MediaFacts {
	std::optional<unsigned> duration;

	/**
	 * The display name of the input file (decoded).
	 */
	std::optional<std::string> source;

	std::optional<unsigned> fps;

	/**
	 * Apply all extractors whose fact is still unknown to the
	 * given line.
	 *
	 * @return true if a new fact was discovered
	 */
	bool Update(std::string_view line, TextDecoder &decoder);
};
