// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "parser/Timestamp.hxx"

#include <gtest/gtest.h>

#include <fmt/format.h>

using std::string_view_literals::operator""sv;

static_assert(ParseTimestamp("00:00:00.00"sv) == 0u);
static_assert(ParseTimestamp("01:02:03.99"sv) == 3723u);

TEST(Timestamp, Grid)
{
	for (unsigned h = 0; h < 100; ++h) {
		for (unsigned m = 0; m < 100; ++m) {
			for (unsigned s = 0; s < 100; s += 7) {
				const auto text = fmt::format("{:02}:{:02}:{:02}.{:02}",
							      h, m, s, (h + m + s) % 100);
				const auto value = ParseTimestamp(text);
				ASSERT_TRUE(value) << text;
				EXPECT_EQ(*value, (h * 60 + m) * 60 + s) << text;
			}
		}
	}

	/* all seconds values, too */
	for (unsigned s = 0; s < 100; ++s) {
		const auto text = fmt::format("00:00:{:02}.50", s);
		EXPECT_EQ(ParseTimestamp(text), s);
	}
}

TEST(Timestamp, FractionTruncated)
{
	EXPECT_EQ(ParseTimestamp("00:00:09.99"sv), 9u);
	EXPECT_EQ(ParseTimestamp("00:00:09.00"sv), 9u);
	EXPECT_EQ(ParseTimestamp("00:01:40.00, start"sv), 100u);
}

TEST(Timestamp, Malformed)
{
	EXPECT_FALSE(ParseTimestamp(""sv));
	EXPECT_FALSE(ParseTimestamp("00:00:10"sv));
	EXPECT_FALSE(ParseTimestamp("00:00:10."sv));
	EXPECT_FALSE(ParseTimestamp("00:00:10.0"sv));
	EXPECT_FALSE(ParseTimestamp("0:00:10.000"sv));
	EXPECT_FALSE(ParseTimestamp("00-00-10.00"sv));
	EXPECT_FALSE(ParseTimestamp("N/A"sv));
	EXPECT_FALSE(ParseTimestamp("-00:00:01.00"sv));
	EXPECT_FALSE(ParseTimestamp("aa:00:10.00"sv));
}
