// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "term/LineSource.hxx"
#include "io/Pipe.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(LineSource, Lines)
{
	auto [r, w] = CreatePipe();
	w.FullWrite("y\nn\n\nlast"sv);
	w.Close();

	FdLineSource source(r.Get());

	auto line = source.ReadLine(-1);
	ASSERT_TRUE(line);
	EXPECT_EQ(*line, "y");

	line = source.ReadLine(-1);
	ASSERT_TRUE(line);
	EXPECT_EQ(*line, "n");

	line = source.ReadLine(-1);
	ASSERT_TRUE(line);
	EXPECT_EQ(*line, "");

	/* the last line had no terminator */
	line = source.ReadLine(-1);
	ASSERT_TRUE(line);
	EXPECT_EQ(*line, "last");

	EXPECT_FALSE(source.ReadLine(-1));
	EXPECT_FALSE(source.ReadLine(-1));
}

TEST(LineSource, Empty)
{
	auto [r, w] = CreatePipe();
	w.Close();

	FdLineSource source(r.Get());
	EXPECT_FALSE(source.ReadLine(-1));
}

TEST(LineSource, Cancel)
{
	auto [r, w] = CreatePipe();
	auto [cancel_r, cancel_w] = CreatePipe();

	FdLineSource source(r.Get());

	/* no input yet, but the cancel pipe is readable */
	cancel_w.FullWrite("x"sv);
	EXPECT_THROW(source.ReadLine(cancel_r.Get()), ReadCancelled);

	/* buffered lines are returned without waiting */
	w.FullWrite("a\nb\n"sv);
	auto line = source.ReadLine(-1);
	ASSERT_TRUE(line);
	EXPECT_EQ(*line, "a");

	line = source.ReadLine(cancel_r.Get());
	ASSERT_TRUE(line);
	EXPECT_EQ(*line, "b");
}
