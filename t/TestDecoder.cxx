// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "term/Decoder.hxx"

#include <gtest/gtest.h>

#include <system_error>

using std::string_view_literals::operator""sv;

TEST(Decoder, UTF8)
{
	TextDecoder decoder("UTF-8");
	EXPECT_EQ(decoder.GetCharset(), "UTF-8");
	EXPECT_EQ(decoder.Decode(""sv), "");
	EXPECT_EQ(decoder.Decode("clip.mp4"sv), "clip.mp4");
	EXPECT_EQ(decoder.Decode("K\xc3\xa4se.mkv"sv), "K\xc3\xa4se.mkv");
}

TEST(Decoder, Invalid)
{
	TextDecoder decoder("UTF-8");

	/* an invalid byte */
	EXPECT_EQ(decoder.Decode("a\xff" "b"sv), "a\xef\xbf\xbd" "b");

	/* a truncated sequence at the end */
	EXPECT_EQ(decoder.Decode("a\xc3"sv), "a\xef\xbf\xbd");

	/* the decoder is usable afterwards */
	EXPECT_EQ(decoder.Decode("ok"sv), "ok");
}

TEST(Decoder, Latin1)
{
	TextDecoder decoder("ISO-8859-1");
	EXPECT_EQ(decoder.Decode("caf\xe9"sv), "caf\xc3\xa9");
}

TEST(Decoder, Long)
{
	/* more than one output buffer */
	const std::string input(5000, '\xe9');
	std::string expected;
	for (unsigned i = 0; i < 5000; ++i)
		expected += "\xc3\xa9";

	TextDecoder decoder("ISO-8859-1");
	EXPECT_EQ(decoder.Decode(input), expected);
}

TEST(Decoder, Unsupported)
{
	EXPECT_THROW(TextDecoder("NO-SUCH-CHARSET-42"), std::system_error);
}

TEST(Decoder, IsUTF8Charset)
{
	EXPECT_TRUE(IsUTF8Charset("UTF-8"));
	EXPECT_TRUE(IsUTF8Charset("utf-8"));
	EXPECT_TRUE(IsUTF8Charset("UTF8"));
	EXPECT_FALSE(IsUTF8Charset("ANSI_X3.4-1968"));
	EXPECT_FALSE(IsUTF8Charset("ISO-8859-1"));
	EXPECT_FALSE(IsUTF8Charset(""));
}
