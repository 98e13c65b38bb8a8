// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <string_view>

constexpr bool
IsDigitASCII(char ch) noexcept
{
	return ch >= '0' && ch <= '9';
}

/**
 * Parse exactly two ASCII digits.
 */
constexpr std::optional<unsigned>
ParseTwoDigits(std::string_view s) noexcept
{
	if (s.size() < 2 || !IsDigitASCII(s[0]) || !IsDigitASCII(s[1]))
		return std::nullopt;

	return unsigned(s[0] - '0') * 10 + unsigned(s[1] - '0');
}

constexpr unsigned
ToSeconds(unsigned hours, unsigned minutes, unsigned seconds) noexcept
{
	return (hours * 60 + minutes) * 60 + seconds;
}

/**
 * Parse a timestamp in the form "HH:MM:SS.ff" at the beginning of
 * the given string.  Each field is exactly two digits; the fraction
 * is required but truncated.
 *
 * @return the number of whole seconds or std::nullopt if the string
 * does not start with a timestamp
 */
constexpr std::optional<unsigned>
ParseTimestamp(std::string_view s) noexcept
{
	if (s.size() < 11 || s[2] != ':' || s[5] != ':' || s[8] != '.')
		return std::nullopt;

	const auto hours = ParseTwoDigits(s.substr(0, 2));
	const auto minutes = ParseTwoDigits(s.substr(3, 2));
	const auto seconds = ParseTwoDigits(s.substr(6, 2));
	if (!hours || !minutes || !seconds ||
	    !ParseTwoDigits(s.substr(9, 2)))
		return std::nullopt;

	return ToSeconds(*hours, *minutes, *seconds);
}
