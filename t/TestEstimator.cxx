// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FakeRenderer.hxx"
#include "progress/Estimator.hxx"
#include "progress/ColorBand.hxx"
#include "parser/Facts.hxx"
#include "term/Style.hxx"

#include <gtest/gtest.h>

#include <fmt/color.h>

/**
 * Text styles cannot be compared; compare the escape sequences they
 * produce instead.
 */
static std::string
Render(const fmt::text_style &style)
{
	return fmt::format(style, "x");
}

TEST(Estimator, Frames)
{
	FakeRendererFactory factory;
	const auto style = TerminalStyle::Plain();
	ProgressEstimator estimator(factory, style);

	MediaFacts facts;
	facts.duration = 100;
	facts.source = "clip.mp4";
	facts.fps = 25;

	EXPECT_FALSE(estimator.HasBar());
	estimator.OnPosition(10, facts);
	EXPECT_TRUE(estimator.HasBar());

	EXPECT_EQ(factory.log.n_created, 1u);
	EXPECT_EQ(factory.log.options.unit, ProgressUnit::FRAMES);
	EXPECT_EQ(factory.log.options.total, 2500u);
	EXPECT_EQ(factory.log.options.label, "clip.mp4");
	ASSERT_EQ(factory.log.deltas.size(), 1u);
	EXPECT_EQ(factory.log.deltas.front(), 250u);

	estimator.OnPosition(20, facts);
	EXPECT_EQ(factory.log.n_created, 1u);
	ASSERT_EQ(factory.log.deltas.size(), 2u);
	EXPECT_EQ(factory.log.deltas.back(), 250u);
	EXPECT_EQ(estimator.GetPosition(), 500u);

	estimator.Close();
	EXPECT_EQ(factory.log.n_closed, 1u);
}

TEST(Estimator, Seconds)
{
	FakeRendererFactory factory;
	const auto style = TerminalStyle::Plain();
	ProgressEstimator estimator(factory, style);

	MediaFacts facts;
	facts.duration = 100;

	estimator.OnPosition(10, facts);
	EXPECT_EQ(factory.log.options.unit, ProgressUnit::SECONDS);
	EXPECT_EQ(factory.log.options.total, 100u);
	EXPECT_FALSE(factory.log.options.label);
	ASSERT_EQ(factory.log.deltas.size(), 1u);
	EXPECT_EQ(factory.log.deltas.front(), 10u);

	estimator.Close();
}

TEST(Estimator, Indeterminate)
{
	FakeRendererFactory factory;
	const auto style = TerminalStyle::Plain();
	ProgressEstimator estimator(factory, style);

	const MediaFacts facts;
	estimator.OnPosition(3, facts);

	EXPECT_EQ(factory.log.n_created, 1u);
	EXPECT_FALSE(factory.log.options.total);
	EXPECT_FALSE(estimator.GetTotal());
	EXPECT_EQ(factory.log.GetPosition(), 3u);

	estimator.Close();
}

TEST(Estimator, ZeroFrameRate)
{
	FakeRendererFactory factory;
	const auto style = TerminalStyle::Plain();
	ProgressEstimator estimator(factory, style);

	MediaFacts facts;
	facts.duration = 60;
	facts.fps = 0;

	estimator.OnPosition(5, facts);
	EXPECT_EQ(estimator.GetUnit(), ProgressUnit::SECONDS);
	EXPECT_EQ(factory.log.options.total, 60u);
	EXPECT_EQ(factory.log.GetPosition(), 5u);

	estimator.Close();
}

TEST(Estimator, LateFrameRate)
{
	FakeRendererFactory factory;
	const auto style = TerminalStyle::Plain();
	ProgressEstimator estimator(factory, style);

	MediaFacts facts;
	facts.duration = 100;

	estimator.OnPosition(10, facts);
	EXPECT_EQ(estimator.GetUnit(), ProgressUnit::SECONDS);

	/* the unit stays locked */
	facts.fps = 25;
	estimator.OnPosition(20, facts);
	EXPECT_EQ(estimator.GetUnit(), ProgressUnit::SECONDS);
	EXPECT_EQ(estimator.GetTotal(), 100u);
	EXPECT_EQ(factory.log.n_created, 1u);
	EXPECT_TRUE(factory.log.totals.empty());

	ASSERT_EQ(factory.log.deltas.size(), 2u);
	EXPECT_EQ(factory.log.deltas[0], 10u);
	EXPECT_EQ(factory.log.deltas[1], 10u);

	estimator.Close();
}

TEST(Estimator, LateDuration)
{
	FakeRendererFactory factory;
	const auto style = TerminalStyle::Plain();
	ProgressEstimator estimator(factory, style);

	MediaFacts facts;
	facts.fps = 25;

	estimator.OnPosition(1, facts);
	EXPECT_EQ(estimator.GetUnit(), ProgressUnit::FRAMES);
	EXPECT_FALSE(factory.log.options.total);

	facts.duration = 10;
	estimator.OnPosition(2, facts);
	ASSERT_EQ(factory.log.totals.size(), 1u);
	EXPECT_EQ(factory.log.totals.front(), 250u);
	EXPECT_EQ(estimator.GetTotal(), 250u);

	/* only once */
	estimator.OnPosition(3, facts);
	EXPECT_EQ(factory.log.totals.size(), 1u);
	EXPECT_EQ(factory.log.GetPosition(), 75u);

	estimator.Close();
}

TEST(Estimator, Regression)
{
	FakeRendererFactory factory;
	const auto style = TerminalStyle::Plain();
	ProgressEstimator estimator(factory, style);

	MediaFacts facts;
	facts.duration = 100;

	uint64_t previous = 0;
	for (const unsigned position : {10u, 20u, 15u, 5u, 20u, 30u, 0u, 31u}) {
		estimator.OnPosition(position, facts);
		EXPECT_GE(factory.log.GetPosition(), previous);
		previous = factory.log.GetPosition();
	}

	ASSERT_EQ(factory.log.deltas.size(), 4u);
	EXPECT_EQ(factory.log.deltas[0], 10u);
	EXPECT_EQ(factory.log.deltas[1], 10u);
	EXPECT_EQ(factory.log.deltas[2], 10u);
	EXPECT_EQ(factory.log.deltas[3], 1u);
	EXPECT_EQ(estimator.GetPosition(), 31u);

	for (const auto i : factory.log.deltas)
		EXPECT_GT(i, 0u);

	estimator.Close();
}

TEST(Estimator, Close)
{
	FakeRendererFactory factory;
	const auto style = TerminalStyle::Plain();

	{
		/* no bar: nothing to close */
		ProgressEstimator estimator(factory, style);
		estimator.Close();
		EXPECT_EQ(factory.log.n_closed, 0u);
	}

	{
		ProgressEstimator estimator(factory, style);
		estimator.OnPosition(1, MediaFacts{});
		estimator.Close();
		estimator.Close();
		EXPECT_EQ(factory.log.n_closed, 1u);

		/* updates after Close() are ignored */
		estimator.OnPosition(50, MediaFacts{});
		EXPECT_EQ(factory.log.GetPosition(), 1u);
		EXPECT_EQ(factory.log.n_created, 1u);
	}
}

TEST(Estimator, ColorBands)
{
	EXPECT_EQ(GetColorBand(0), ColorBand::STARTING);
	EXPECT_EQ(GetColorBand(24.9), ColorBand::STARTING);
	EXPECT_EQ(GetColorBand(25), ColorBand::LOWER_HALF);
	EXPECT_EQ(GetColorBand(49.9), ColorBand::LOWER_HALF);
	EXPECT_EQ(GetColorBand(50), ColorBand::UPPER_HALF);
	EXPECT_EQ(GetColorBand(75), ColorBand::FINISHING);
	EXPECT_EQ(GetColorBand(94.9), ColorBand::FINISHING);
	EXPECT_EQ(GetColorBand(95), ColorBand::ALMOST_DONE);
	EXPECT_EQ(GetColorBand(100), ColorBand::ALMOST_DONE);
	EXPECT_EQ(GetColorBand(120), ColorBand::ALMOST_DONE);

	FakeRendererFactory factory;
	MediaFacts facts;
	facts.duration = 100;

	{
		/* plain: the bar style is never touched */
		const auto style = TerminalStyle::Plain();
		ProgressEstimator estimator(factory, style);
		estimator.OnPosition(50, facts);
		estimator.Close();
		EXPECT_TRUE(factory.log.bar_styles.empty());
	}

	{
		const auto style = TerminalStyle::Colored();
		ProgressEstimator estimator(factory, style);
		estimator.OnPosition(10, facts);
		estimator.OnPosition(60, facts);
		estimator.OnPosition(97, facts);
		estimator.Close();

		ASSERT_EQ(factory.log.bar_styles.size(), 3u);
		EXPECT_EQ(Render(factory.log.bar_styles[0]),
			  Render(style.GetBandStyle(ColorBand::STARTING)));
		EXPECT_EQ(Render(factory.log.bar_styles[1]),
			  Render(style.GetBandStyle(ColorBand::UPPER_HALF)));
		EXPECT_EQ(Render(factory.log.bar_styles[2]),
			  Render(style.GetBandStyle(ColorBand::ALMOST_DONE)));
	}
}

TEST(Estimator, TrimLabel)
{
	EXPECT_EQ(TrimLabel("clip.mp4"), "clip.mp4");
	EXPECT_EQ(TrimLabel(""), "");

	/* exactly 30 characters */
	EXPECT_EQ(TrimLabel("abcdefghijklmnopqrstuvwxyz0123"),
		  "abcdefghijklmnopqrstuvwxyz0123");

	EXPECT_EQ(TrimLabel("abcdefghijklmnopqrstuvwxyz01234"),
		  "abcdefghijklmnopqrstuvwxyz0...");

	/* code points, not bytes */
	std::string label;
	for (unsigned i = 0; i < 30; ++i)
		label += "\xc3\xa4";
	EXPECT_EQ(TrimLabel(label), label);

	label += "\xc3\xa4";
	std::string expected;
	for (unsigned i = 0; i < 27; ++i)
		expected += "\xc3\xa4";
	expected += "...";
	EXPECT_EQ(TrimLabel(label), expected);
}
