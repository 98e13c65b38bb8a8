// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "parser/LineAccumulator.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using std::string_view_literals::operator""sv;

static std::vector<std::string>
FeedAll(LineAccumulator &a, std::string_view src)
{
	std::vector<std::string> result;
	for (const char ch : src)
		if (const auto line = a.Feed(ch))
			result.emplace_back(*line);
	return result;
}

TEST(LineAccumulator, Basic)
{
	{
		LineAccumulator a;
		EXPECT_EQ(a.GetLastLine(), nullptr);
		EXPECT_FALSE(a.Feed('a'));
		EXPECT_FALSE(a.Feed('b'));
		EXPECT_EQ(a.GetPartial(), "ab"sv);

		const auto line = a.Feed('\n');
		ASSERT_TRUE(line);
		EXPECT_EQ(*line, "ab"sv);
		EXPECT_TRUE(a.GetPartial().empty());
		ASSERT_NE(a.GetLastLine(), nullptr);
		EXPECT_EQ(*a.GetLastLine(), "ab");
	}

	{
		/* CR terminates a line, too */
		LineAccumulator a;
		const auto lines = FeedAll(a, "frame=1\rframe=2\r"sv);
		ASSERT_EQ(lines.size(), 2u);
		EXPECT_EQ(lines[0], "frame=1");
		EXPECT_EQ(lines[1], "frame=2");
	}
}

TEST(LineAccumulator, EmptyLines)
{
	{
		/* CRLF yields an empty line */
		LineAccumulator a;
		const auto lines = FeedAll(a, "x\r\n"sv);
		ASSERT_EQ(lines.size(), 2u);
		EXPECT_EQ(lines[0], "x");
		EXPECT_EQ(lines[1], "");
	}

	{
		LineAccumulator a;
		const auto lines = FeedAll(a, "\n\n\n"sv);
		ASSERT_EQ(lines.size(), 3u);
		for (const auto &i : lines)
			EXPECT_TRUE(i.empty());
		EXPECT_EQ(a.GetHistory().size(), 3u);
	}
}

TEST(LineAccumulator, ChunkingIndependence)
{
	const std::string_view input =
		"Input #0, mov,mp4, from 'clip.mp4':\n"
		"  Duration: 00:01:40.00, start: 0.000000\r\n"
		"frame=  10 fps= 25 q=28.0 time=00:00:10.00\r"
		"frame=  20 fps= 25 q=28.0 time=00:00:20.00\r"
		"no terminator"sv;

	LineAccumulator reference;
	const auto expected = FeedAll(reference, input);
	ASSERT_EQ(expected.size(), 5u);

	for (std::size_t chunk_size = 1; chunk_size <= input.size(); ++chunk_size) {
		LineAccumulator a;
		std::vector<std::string> lines;

		for (std::size_t i = 0; i < input.size(); i += chunk_size) {
			const auto chunk = FeedAll(a, input.substr(i, chunk_size));
			lines.insert(lines.end(), chunk.begin(), chunk.end());
		}

		EXPECT_EQ(lines, expected);
		EXPECT_EQ(a.GetPartial(), "no terminator"sv);
		EXPECT_EQ(a.GetHistory(), reference.GetHistory());
	}
}

TEST(LineAccumulator, ForceComplete)
{
	LineAccumulator a;
	FeedAll(a, "Overwrite? [y/N] "sv);
	EXPECT_EQ(a.ForceComplete(), "Overwrite? [y/N] "sv);
	EXPECT_TRUE(a.GetPartial().empty());
	ASSERT_EQ(a.GetHistory().size(), 1u);
	EXPECT_EQ(a.GetHistory().front(), "Overwrite? [y/N] ");

	/* forcing an empty buffer yields an empty line */
	EXPECT_EQ(a.ForceComplete(), ""sv);
	EXPECT_EQ(a.GetHistory().size(), 2u);
}

TEST(LineAccumulator, Flush)
{
	{
		LineAccumulator a;
		EXPECT_FALSE(a.Flush());
		EXPECT_TRUE(a.GetHistory().empty());
	}

	{
		LineAccumulator a;
		FeedAll(a, "one\ntwo"sv);
		const auto line = a.Flush();
		ASSERT_TRUE(line);
		EXPECT_EQ(*line, "two"sv);
		EXPECT_EQ(*a.GetLastLine(), "two");

		/* nothing left */
		EXPECT_FALSE(a.Flush());
		EXPECT_EQ(a.GetHistory().size(), 2u);
	}
}
