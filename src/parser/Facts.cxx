// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Facts.hxx"
#include "Timestamp.hxx"
#include "term/Decoder.hxx"

using std::string_view_literals::operator""sv;

/**
 * Find the first occurrence of #prefix which is followed by a
 * timestamp.
 */
static std::optional<unsigned>
FindTimestampAfter(std::string_view line, std::string_view prefix) noexcept
{
	for (auto i = line.find(prefix); i != line.npos;
	     i = line.find(prefix, i + 1)) {
		const auto value = ParseTimestamp(line.substr(i + prefix.size()));
		if (value)
			return value;
	}

	return std::nullopt;
}

std::optional<unsigned>
ExtractDuration(std::string_view line) noexcept
{
	return FindTimestampAfter(line, "Duration: "sv);
}

std::optional<unsigned>
ExtractPosition(std::string_view line) noexcept
{
	return FindTimestampAfter(line, "time="sv);
}

std::optional<std::string_view>
ExtractSource(std::string_view line) noexcept
{
	static constexpr auto prefix = "from '"sv;

	const auto begin = line.find(prefix);
	if (begin == line.npos)
		return std::nullopt;

	const auto path_begin = begin + prefix.size();
	const auto end = line.rfind("':"sv);
	if (end == line.npos || end < path_begin)
		return std::nullopt;

	auto path = line.substr(path_begin, end - path_begin);
	if (const auto slash = path.rfind('/'); slash != path.npos)
		path.remove_prefix(slash + 1);

	return path;
}

/**
 * Parse the frame rate which immediately precedes the " fps" at
 * position #p.
 */
static std::optional<unsigned>
ParseFrameRateBefore(std::string_view line, std::size_t p) noexcept
{
	if (p >= 5 && line[p - 3] == '.') {
		const auto integral = ParseTwoDigits(line.substr(p - 5, 2));
		const auto fraction = ParseTwoDigits(line.substr(p - 2, 2));
		if (integral && fraction)
			return RoundHalfEven(*integral * 100 + *fraction);
	}

	if (p >= 2)
		return ParseTwoDigits(line.substr(p - 2, 2));

	return std::nullopt;
}

/**
 * Parse the encoder status field "fps= 25" or "fps=29.97".  Zero
 * (printed before the first frame has been encoded) is not a frame
 * rate.
 */
static std::optional<unsigned>
ParseStatusFrameRate(std::string_view line) noexcept
{
	static constexpr auto prefix = "fps="sv;

	for (auto i = line.find(prefix); i != line.npos;
	     i = line.find(prefix, i + 1)) {
		auto s = line.substr(i + prefix.size());
		while (!s.empty() && s.front() == ' ')
			s.remove_prefix(1);

		unsigned integral = 0, n_digits = 0;
		for (; !s.empty() && IsDigitASCII(s.front()) && n_digits < 6;
		     s.remove_prefix(1), ++n_digits)
			integral = integral * 10 + unsigned(s.front() - '0');

		if (n_digits == 0)
			continue;

		unsigned fraction = 0;
		if (!s.empty() && s.front() == '.') {
			s.remove_prefix(1);
			for (unsigned scale = 10; scale > 0 && !s.empty() &&
				     IsDigitASCII(s.front());
			     s.remove_prefix(1), scale /= 10)
				fraction += unsigned(s.front() - '0') * scale;
		}

		const unsigned value = RoundHalfEven(integral * 100 + fraction);
		if (value > 0)
			return value;
	}

	return std::nullopt;
}

std::optional<unsigned>
ExtractFrameRate(std::string_view line) noexcept
{
	static constexpr auto suffix = " fps"sv;

	for (auto i = line.find(suffix); i != line.npos;
	     i = line.find(suffix, i + 1)) {
		const auto after = i + suffix.size();
		if (after < line.size() && line[after] == '=')
			/* "frame=  10 fps= 25": the number in front
			   is the frame counter */
			continue;

		const auto value = ParseFrameRateBefore(line, i);
		if (value)
			return value;
	}

	return ParseStatusFrameRate(line);
}

bool
MediaFacts::Update(std::string_view line, TextDecoder &decoder)
{
	bool modified = false;

	if (!duration) {
		duration = ExtractDuration(line);
		modified |= duration.has_value();
	}

	if (!source) {
		if (const auto name = ExtractSource(line)) {
			source = decoder.Decode(*name);
			modified = true;
		}
	}

	if (!fps) {
		fps = ExtractFrameRate(line);
		modified |= fps.has_value();
	}

	return modified;
}
