// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FakeRenderer.hxx"
#include "Notifier.hxx"
#include "term/Decoder.hxx"
#include "term/LineSource.hxx"
#include "term/Style.hxx"
#include "spawn/InputChannel.hxx"

#include <gtest/gtest.h>

#include <deque>
#include <stdexcept>
#include <string>
#include <vector>

#include <stdio.h>

using std::string_view_literals::operator""sv;

class FakeLineSource final : public LineSource {
public:
	std::deque<std::string> lines;
	unsigned n_reads = 0;
	int last_cancel_fd = -1;
	bool cancelled = false;

	std::optional<std::string> ReadLine(int cancel_fd) override {
		++n_reads;
		last_cancel_fd = cancel_fd;

		if (cancelled)
			throw ReadCancelled();

		if (lines.empty())
			return std::nullopt;

		auto line = std::move(lines.front());
		lines.pop_front();
		return line;
	}
};

class FakeInputChannel final : public InputChannel {
public:
	std::vector<std::string> written;
	unsigned n_closed = 0;

	void WriteLine(std::string_view line) override {
		written.emplace_back(line);
	}

	void Close() noexcept override {
		++n_closed;
	}
};

/**
 * Everything a #ProgressNotifier needs, with the output going to a
 * temporary file.
 */
struct NotifierFixture {
	FILE *const file = tmpfile();
	const TerminalStyle style = TerminalStyle::Plain();
	TextDecoder decoder{"UTF-8"};
	FakeRendererFactory factory;
	FakeLineSource line_source;
	FakeInputChannel input;

	NotifierFixture() {
		if (file == nullptr)
			throw std::runtime_error("tmpfile() failed");
	}

	~NotifierFixture() noexcept {
		fclose(file);
	}

	std::string ReadOutput() const {
		fflush(file);
		rewind(file);

		std::string result;
		int ch;
		while ((ch = getc(file)) != EOF)
			result.push_back(static_cast<char>(ch));
		return result;
	}
};

TEST(Notifier, ScenarioFrames)
{
	NotifierFixture f;
	ProgressNotifier notifier(f.file, f.style, f.decoder, f.factory,
				  &f.line_source, &f.input);

	notifier.Feed("  Duration: 00:01:40.00, start: 0.000000, bitrate: 1205 kb/s\n"sv);
	notifier.Feed("Input #0, mov,mp4,m4a,3gp,3g2,mj2, from 'clip.mp4':\n"sv);
	EXPECT_EQ(f.factory.log.n_created, 0u);

	notifier.Feed("frame=  10 fps= 25 q=28.0 size=     256kB time=00:00:10.00 bitrate= 209.7kbits/s speed=   1x\r"sv);

	EXPECT_EQ(f.factory.log.n_created, 1u);
	EXPECT_EQ(f.factory.log.options.unit, ProgressUnit::FRAMES);
	EXPECT_EQ(f.factory.log.options.total, 2500u);
	EXPECT_EQ(f.factory.log.options.label, "clip.mp4");
	ASSERT_EQ(f.factory.log.deltas.size(), 1u);
	EXPECT_EQ(f.factory.log.deltas.front(), 250u);

	notifier.Close();
	EXPECT_EQ(f.factory.log.n_closed, 1u);
}

TEST(Notifier, ScenarioFramesFromStream)
{
	NotifierFixture f;
	ProgressNotifier notifier(f.file, f.style, f.decoder, f.factory,
				  &f.line_source, &f.input);

	notifier.Feed("Input #0, mov,mp4,m4a,3gp,3g2,mj2, from 'clip.mp4':\n"
		      "  Duration: 00:01:40.00, start: 0.000000, bitrate: 1205 kb/s\n"
		      "    Stream #0:0(und): Video: h264 (High), yuv420p, 1920x1080, 1063 kb/s, 25 fps, 25 tbr, 12800 tbn (default)\n"
		      "frame=  10 fps=0.0 q=28.0 size=     256kB time=00:00:10.00 bitrate= 209.7kbits/s speed=  20x\r"sv);

	EXPECT_EQ(f.factory.log.n_created, 1u);
	EXPECT_EQ(f.factory.log.options.unit, ProgressUnit::FRAMES);
	EXPECT_EQ(f.factory.log.options.total, 2500u);
	ASSERT_EQ(f.factory.log.deltas.size(), 1u);
	EXPECT_EQ(f.factory.log.deltas.front(), 250u);

	ASSERT_TRUE(notifier.GetFacts().fps);
	EXPECT_EQ(*notifier.GetFacts().fps, 25u);

	notifier.Close();
}

TEST(Notifier, ScenarioSeconds)
{
	NotifierFixture f;
	ProgressNotifier notifier(f.file, f.style, f.decoder, f.factory,
				  &f.line_source, &f.input);

	notifier.Feed("  Duration: 00:01:40.00, start: 0.000000, bitrate: 128 kb/s\n"
		      "Input #0, mp3, from 'song.mp3':\n"
		      "size=     160kB time=00:00:10.00 bitrate= 131.1kbits/s speed=  50x\r"sv);

	EXPECT_EQ(f.factory.log.n_created, 1u);
	EXPECT_EQ(f.factory.log.options.unit, ProgressUnit::SECONDS);
	EXPECT_EQ(f.factory.log.options.total, 100u);
	EXPECT_EQ(f.factory.log.options.label, "song.mp3");
	ASSERT_EQ(f.factory.log.deltas.size(), 1u);
	EXPECT_EQ(f.factory.log.deltas.front(), 10u);

	notifier.Feed("size=     320kB time=00:00:20.00 bitrate= 131.1kbits/s speed=  50x\r"sv);
	ASSERT_EQ(f.factory.log.deltas.size(), 2u);
	EXPECT_EQ(f.factory.log.GetPosition(), 20u);

	notifier.Close();
}

TEST(Notifier, FrameRateOrdering)
{
	{
		/* the frame rate is known before the first position */
		NotifierFixture f;
		ProgressNotifier notifier(f.file, f.style, f.decoder, f.factory,
					  &f.line_source, &f.input);

		notifier.Feed("  Duration: 00:00:10.00, start: 0.000000\n"
			      "    Stream #0:0: Video: h264, 30 fps, 30 tbr\n"
			      "size=N/A time=00:00:01.00\r"
			      "size=N/A time=00:00:02.00\r"sv);
		EXPECT_EQ(notifier.GetEstimator().GetUnit(), ProgressUnit::FRAMES);
		EXPECT_EQ(f.factory.log.options.total, 300u);
		EXPECT_EQ(f.factory.log.GetPosition(), 60u);
		notifier.Close();
	}

	{
		/* the frame rate shows up after the first position: the
		   unit remains seconds */
		NotifierFixture f;
		ProgressNotifier notifier(f.file, f.style, f.decoder, f.factory,
					  &f.line_source, &f.input);

		notifier.Feed("  Duration: 00:00:10.00, start: 0.000000\n"
			      "size=N/A time=00:00:01.00\r"
			      "    Stream #0:0: Video: h264, 30 fps, 30 tbr\n"
			      "size=N/A time=00:00:02.00\r"sv);
		EXPECT_EQ(notifier.GetEstimator().GetUnit(), ProgressUnit::SECONDS);
		EXPECT_EQ(f.factory.log.n_created, 1u);
		EXPECT_EQ(f.factory.log.options.total, 10u);
		EXPECT_EQ(f.factory.log.GetPosition(), 2u);

		ASSERT_TRUE(notifier.GetFacts().fps);
		EXPECT_EQ(*notifier.GetFacts().fps, 30u);
		notifier.Close();
	}
}

TEST(Notifier, ScenarioPrompt)
{
	NotifierFixture f;
	f.line_source.lines.emplace_back("y");

	ProgressNotifier notifier(f.file, f.style, f.decoder, f.factory,
				  &f.line_source, &f.input);

	notifier.Feed("Input #0, mov,mp4, from 'clip.mp4':\n"sv);
	EXPECT_EQ(notifier.GetLines().GetHistory().size(), 1u);

	constexpr auto prompt = "File 'out.mp4' already exists. Overwrite? [y/N] "sv;
	for (const char ch : prompt)
		notifier.Feed(ch);

	EXPECT_EQ(f.line_source.n_reads, 1u);
	ASSERT_EQ(f.input.written.size(), 1u);
	EXPECT_EQ(f.input.written.front(), "y\n");
	EXPECT_EQ(f.input.n_closed, 0u);

	/* exactly one synthetic line, with all bytes */
	const auto &history = notifier.GetLines().GetHistory();
	ASSERT_EQ(history.size(), 2u);
	EXPECT_EQ(history.back(), prompt);
	EXPECT_TRUE(notifier.GetLines().GetPartial().empty());

	/* the question was shown */
	EXPECT_EQ(f.ReadOutput(), prompt);

	/* the stream goes on normally */
	notifier.Feed("Output #0, mp4, to 'out.mp4':\n"sv);
	EXPECT_EQ(history.size(), 3u);
	EXPECT_EQ(f.line_source.n_reads, 1u);
	EXPECT_EQ(f.input.written.size(), 1u);

	notifier.Close();
	EXPECT_EQ(f.factory.log.n_closed, 0u);
}

TEST(Notifier, PromptEndOfInput)
{
	NotifierFixture f;
	ProgressNotifier notifier(f.file, f.style, f.decoder, f.factory,
				  &f.line_source, &f.input);

	notifier.Feed("Overwrite? [y/N] "sv);

	EXPECT_EQ(f.line_source.n_reads, 1u);
	EXPECT_TRUE(f.input.written.empty());
	EXPECT_EQ(f.input.n_closed, 1u);
	EXPECT_EQ(notifier.GetLines().GetHistory().size(), 1u);

	notifier.Close();
}

TEST(Notifier, PromptCancelled)
{
	NotifierFixture f;
	f.line_source.cancelled = true;
	ProgressNotifier notifier(f.file, f.style, f.decoder, f.factory,
				  &f.line_source, &f.input, 42);

	EXPECT_THROW(notifier.Feed("Overwrite? [y/N] "sv), ReadCancelled);

	EXPECT_EQ(f.line_source.n_reads, 1u);
	EXPECT_EQ(f.line_source.last_cancel_fd, 42);
	EXPECT_TRUE(f.input.written.empty());
	EXPECT_EQ(f.input.n_closed, 0u);

	/* the question was shown before waiting */
	EXPECT_EQ(f.ReadOutput(), "Overwrite? [y/N] ");

	notifier.Close();
}

TEST(Notifier, PromptWithoutForwarding)
{
	/* the encoder reads our stdin itself */
	NotifierFixture f;
	ProgressNotifier notifier(f.file, f.style, f.decoder, f.factory,
				  nullptr, nullptr);

	notifier.Feed("Overwrite? [y/N] "sv);

	EXPECT_EQ(f.line_source.n_reads, 0u);
	EXPECT_EQ(notifier.GetLines().GetHistory().size(), 1u);
	EXPECT_EQ(f.ReadOutput(), "Overwrite? [y/N] ");

	notifier.Close();
}

TEST(Notifier, Flush)
{
	NotifierFixture f;
	ProgressNotifier notifier(f.file, f.style, f.decoder, f.factory,
				  &f.line_source, &f.input);

	notifier.Feed("size=N/A time=00:00:05.00"sv);
	EXPECT_EQ(f.factory.log.n_created, 0u);
	EXPECT_FALSE(notifier.GetLastLine());

	notifier.Flush();
	EXPECT_EQ(f.factory.log.n_created, 1u);
	EXPECT_EQ(f.factory.log.GetPosition(), 5u);
	EXPECT_EQ(notifier.GetLastLine(), "size=N/A time=00:00:05.00");

	notifier.Close();
}

TEST(Notifier, LastLine)
{
	NotifierFixture f;
	ProgressNotifier notifier(f.file, f.style, f.decoder, f.factory,
				  &f.line_source, &f.input);

	notifier.Feed("ffmpeg version 6.0\n"
		      "nope.mp4: No such file or directory\n"sv);
	EXPECT_EQ(notifier.GetLastLine(), "nope.mp4: No such file or directory");
	EXPECT_EQ(f.factory.log.n_created, 0u);

	notifier.Close();
	EXPECT_EQ(f.factory.log.n_closed, 0u);

	/* the diagnostic stream is not echoed */
	EXPECT_TRUE(f.ReadOutput().empty());
}
