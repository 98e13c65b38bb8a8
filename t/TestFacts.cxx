// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "parser/Facts.hxx"
#include "term/Decoder.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

static_assert(RoundHalfEven(2350) == 24);
static_assert(RoundHalfEven(2450) == 24);
static_assert(RoundHalfEven(2997) == 30);
static_assert(RoundHalfEven(2500) == 25);

TEST(Facts, Duration)
{
	EXPECT_EQ(ExtractDuration("  Duration: 00:01:40.00, start: 0.000000, bitrate: 1205 kb/s"sv), 100u);
	EXPECT_EQ(ExtractDuration("  Duration: 01:00:00.99, start: 0.000000"sv), 3600u);
	EXPECT_FALSE(ExtractDuration("  Duration: N/A, bitrate: N/A"sv));
	EXPECT_FALSE(ExtractDuration("frame=  10 fps= 25 time=00:00:10.00"sv));
}

TEST(Facts, Position)
{
	EXPECT_EQ(ExtractPosition("frame=  10 fps= 25 q=28.0 size=     256kB time=00:00:10.00 bitrate= 209.7kbits/s speed=   1x"sv), 10u);
	EXPECT_EQ(ExtractPosition("size=    1024kB time=00:01:05.48 bitrate= 128.0kbits/s"sv), 65u);
	EXPECT_FALSE(ExtractPosition("size=       0kB time=N/A bitrate=N/A"sv));

	/* an unparsable occurrence does not hide a later one */
	EXPECT_EQ(ExtractPosition("start_time=N/A time=00:00:03.00"sv), 3u);
}

TEST(Facts, Source)
{
	EXPECT_EQ(ExtractSource("Input #0, mov,mp4,m4a,3gp,3g2,mj2, from 'clip.mp4':"sv),
		  "clip.mp4"sv);
	EXPECT_EQ(ExtractSource("Input #0, matroska,webm, from '/home/user/Videos/movie.mkv':"sv),
		  "movie.mkv"sv);

	/* the path runs to the last "':" */
	EXPECT_EQ(ExtractSource("Input #0, avi, from 'dir/a':b.avi':"sv),
		  "a':b.avi"sv);

	EXPECT_FALSE(ExtractSource("Output #0, mp4, to 'out.mp4':"sv));
	EXPECT_FALSE(ExtractSource("Input #0, avi, from 'unterminated"sv));
}

TEST(Facts, FrameRate)
{
	EXPECT_EQ(ExtractFrameRate("    Stream #0:0(und): Video: h264 (High), yuv420p, 1920x1080, 4842 kb/s, 25 fps, 25 tbr, 12800 tbn"sv), 25u);
	EXPECT_EQ(ExtractFrameRate("Video: h264, yuv420p, 1280x720, 29.97 fps, 29.97 tbr"sv), 30u);
	EXPECT_EQ(ExtractFrameRate("Video: mpeg2video, 23.98 fps, 23.98 tbr"sv), 24u);

	/* round half to even */
	EXPECT_EQ(ExtractFrameRate("Video: foo, 23.50 fps"sv), 24u);
	EXPECT_EQ(ExtractFrameRate("Video: foo, 24.50 fps"sv), 24u);
	EXPECT_EQ(ExtractFrameRate("Video: foo, 24.51 fps"sv), 25u);

	EXPECT_FALSE(ExtractFrameRate("Stream #0:1(und): Audio: aac (LC), 48000 Hz, stereo"sv));
	EXPECT_FALSE(ExtractFrameRate("fps"sv));
}

TEST(Facts, StatusFrameRate)
{
	/* the frame counter in front of "fps=" is not a frame rate;
	   the status value is used instead */
	EXPECT_EQ(ExtractFrameRate("frame=  10 fps= 25 q=28.0 time=00:00:10.00"sv), 25u);
	EXPECT_EQ(ExtractFrameRate("frame=  99 fps=29.97 q=28.0 time=00:00:03.30"sv), 30u);

	/* zero before the first frame has been encoded */
	EXPECT_FALSE(ExtractFrameRate("frame=   0 fps=0.0 q=0.0 size=       0kB time=00:00:00.00"sv));

	/* a stream rate is preferred */
	EXPECT_EQ(ExtractFrameRate("Video: h264, 50 fps, frame= 10 fps= 25"sv), 50u);
}

TEST(Facts, Latching)
{
	TextDecoder decoder("UTF-8");
	MediaFacts facts;

	EXPECT_FALSE(facts.Update("ffmpeg version 6.0 Copyright (c) 2000-2023"sv, decoder));
	EXPECT_FALSE(facts.duration);
	EXPECT_FALSE(facts.source);
	EXPECT_FALSE(facts.fps);

	EXPECT_TRUE(facts.Update("Input #0, mov,mp4, from 'clip.mp4':"sv, decoder));
	EXPECT_TRUE(facts.Update("  Duration: 00:01:40.00, start: 0.000000"sv, decoder));
	EXPECT_TRUE(facts.Update("  Stream #0:0: Video: h264, 25 fps, 25 tbr"sv, decoder));

	/* later matches are ignored */
	EXPECT_FALSE(facts.Update("Input #1, mov,mp4, from 'other.mp4':"sv, decoder));
	EXPECT_FALSE(facts.Update("  Duration: 00:05:00.00, start: 0.000000"sv, decoder));
	EXPECT_FALSE(facts.Update("  Stream #1:0: Video: h264, 50 fps, 50 tbr"sv, decoder));

	ASSERT_TRUE(facts.duration);
	EXPECT_EQ(*facts.duration, 100u);
	ASSERT_TRUE(facts.source);
	EXPECT_EQ(*facts.source, "clip.mp4");
	ASSERT_TRUE(facts.fps);
	EXPECT_EQ(*facts.fps, 25u);
}

TEST(Facts, SourceDecoded)
{
	TextDecoder decoder("ISO-8859-1");
	MediaFacts facts;

	EXPECT_TRUE(facts.Update("Input #0, avi, from 'caf\xe9.avi':"sv, decoder));
	ASSERT_TRUE(facts.source);
	EXPECT_EQ(*facts.source, "caf\xc3\xa9.avi");
}
