// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "progress/TerminalBar.hxx"
#include "term/Style.hxx"

#include <gtest/gtest.h>

#include <string>

#include <stdio.h>

using std::string_view_literals::operator""sv;

/**
 * A temporary file which collects the bar's output.
 */
class OutputFile {
	FILE *const file = tmpfile();

public:
	OutputFile() {
		if (file == nullptr)
			throw std::runtime_error("tmpfile() failed");
	}

	~OutputFile() noexcept {
		fclose(file);
	}

	FILE *Get() const noexcept {
		return file;
	}

	std::string ReadAll() const {
		fflush(file);
		rewind(file);

		std::string result;
		int ch;
		while ((ch = getc(file)) != EOF)
			result.push_back(static_cast<char>(ch));
		return result;
	}
};

TEST(TerminalBar, FormatInterval)
{
	EXPECT_EQ(FormatInterval(std::chrono::seconds(0)), "00:00");
	EXPECT_EQ(FormatInterval(std::chrono::seconds(7)), "00:07");
	EXPECT_EQ(FormatInterval(std::chrono::seconds(65)), "01:05");
	EXPECT_EQ(FormatInterval(std::chrono::seconds(3599)), "59:59");
	EXPECT_EQ(FormatInterval(std::chrono::seconds(3725)), "1:02:05");
	EXPECT_EQ(FormatInterval(std::chrono::seconds(-5)), "00:00");
}

TEST(TerminalBar, CountColumns)
{
	EXPECT_EQ(CountColumns(""sv), 0u);
	EXPECT_EQ(CountColumns("abc"sv), 3u);
	EXPECT_EQ(CountColumns("\xc3\xa4\xe2\x96\x92x"sv), 3u);
}

TEST(TerminalBar, Total)
{
	const OutputFile output;
	const auto style = TerminalStyle::Plain();

	BarOptions options;
	options.label = "clip.mp4";
	options.total = 2500;
	options.unit = ProgressUnit::FRAMES;
	options.style = &style;

	TerminalBar bar(output.Get(), options, 80, false);
	bar.Update(250);

	std::size_t width;
	EXPECT_EQ(bar.Format(std::chrono::seconds(4), width),
		  "clip.mp4:  10%|##                       | 250/2500 [00:04<00:36, 62.50 frames/s]");
	EXPECT_EQ(width, 80u);

	bar.Update(2250);
	EXPECT_EQ(bar.GetPosition(), 2500u);
	EXPECT_EQ(bar.Format(std::chrono::seconds(40), width),
		  "clip.mp4: 100%|########################| 2500/2500 [00:40<00:00, 62.50 frames/s]");
}

TEST(TerminalBar, Unicode)
{
	const OutputFile output;
	const auto style = TerminalStyle::Plain();

	BarOptions options;
	options.total = 4;
	options.style = &style;

	TerminalBar bar(output.Get(), options, 60, true);
	bar.Update(2);

	std::size_t width;
	const auto line = bar.Format(std::chrono::seconds(2), width);
	EXPECT_EQ(width, 60u);
	EXPECT_NE(line.find("\xe2\x96\x92"), line.npos);
	EXPECT_EQ(line.find('#'), line.npos);
	EXPECT_EQ(line.substr(0, 5), " 50%|");

	/* 20 columns for the bar, half of them filled */
	std::size_t n_filled = 0;
	for (auto i = line.find("\xe2\x96\x92"); i != line.npos;
	     i = line.find("\xe2\x96\x92", i + 1))
		++n_filled;
	EXPECT_EQ(n_filled, 10u);
}

TEST(TerminalBar, Indeterminate)
{
	const OutputFile output;
	const auto style = TerminalStyle::Plain();

	BarOptions options;
	options.style = &style;

	TerminalBar bar(output.Get(), options, 80, false);

	std::size_t width;
	EXPECT_EQ(bar.Format(std::chrono::seconds(0), width),
		  "0 seconds [00:00, ? seconds/s]");

	bar.Update(10);
	EXPECT_EQ(bar.Format(std::chrono::seconds(5), width),
		  "10 seconds [00:05, 2.00 seconds/s]");
	EXPECT_EQ(width, 34u);

	/* the total shows up later */
	bar.SetTotal(20);
	EXPECT_EQ(bar.Format(std::chrono::seconds(5), width).substr(0, 5),
		  " 50%|");
}

TEST(TerminalBar, Output)
{
	const OutputFile output;
	const auto style = TerminalStyle::Plain();

	BarOptions options;
	options.label = "clip.mp4";
	options.total = 100;
	options.style = &style;

	{
		TerminalBar bar(output.Get(), options, 80, false,
				std::chrono::hours(1));
		bar.Update(10);
		bar.Update(10);
		bar.Close();
		bar.Close();
	}

	const auto text = output.ReadAll();

	/* plain style: no escape sequences */
	EXPECT_EQ(text.find('\x1b'), text.npos);

	/* one drawing on creation, one on Close(); the updates in
	   between are rate-limited */
	std::size_t n_drawings = 0;
	for (const char ch : text)
		if (ch == '\r')
			++n_drawings;
	EXPECT_EQ(n_drawings, 2u);

	EXPECT_EQ(text.back(), '\n');
	EXPECT_NE(text.find(" 20/100 "), text.npos);

	/* exactly one final newline */
	EXPECT_EQ(text.find('\n'), text.size() - 1);
}

TEST(TerminalBar, Colored)
{
	const OutputFile output;
	const auto style = TerminalStyle::Colored();

	BarOptions options;
	options.label = "clip.mp4";
	options.total = 100;
	options.style = &style;

	TerminalBar bar(output.Get(), options, 80, false);
	bar.Update(50);

	std::size_t width;
	const auto line = bar.Format(std::chrono::seconds(1), width);
	EXPECT_NE(line.find('\x1b'), line.npos);

	/* escape sequences do not count */
	EXPECT_EQ(width, 80u);
}
