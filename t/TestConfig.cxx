// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

#include <stdlib.h>

TEST(Config, Defaults)
{
	const Config config;
	EXPECT_EQ(config.encoder, "ffmpeg");
	EXPECT_EQ(config.color, ColorMode::AUTO);
	EXPECT_TRUE(config.encoding.empty());
	EXPECT_TRUE(config.forward_prompts);
	EXPECT_EQ(config.log_level, 1u);
	EXPECT_NO_THROW(config.Check());
}

TEST(Config, ParseVariable)
{
	Config config;

	EXPECT_TRUE(config.ParseVariable("FFPROGRESS_ENCODER", "/usr/local/bin/ffmpeg"));
	EXPECT_EQ(config.encoder, "/usr/local/bin/ffmpeg");

	EXPECT_TRUE(config.ParseVariable("FFPROGRESS_COLOR", "never"));
	EXPECT_EQ(config.color, ColorMode::NEVER);
	EXPECT_TRUE(config.ParseVariable("FFPROGRESS_COLOR", "always"));
	EXPECT_EQ(config.color, ColorMode::ALWAYS);

	EXPECT_TRUE(config.ParseVariable("FFPROGRESS_ENCODING", "ISO-8859-1"));
	EXPECT_EQ(config.encoding, "ISO-8859-1");

	EXPECT_TRUE(config.ParseVariable("FFPROGRESS_PROMPT", "no"));
	EXPECT_FALSE(config.forward_prompts);
	EXPECT_TRUE(config.ParseVariable("FFPROGRESS_PROMPT", "yes"));
	EXPECT_TRUE(config.forward_prompts);

	EXPECT_TRUE(config.ParseVariable("FFPROGRESS_VERBOSE", "3"));
	EXPECT_EQ(config.log_level, 3u);

	EXPECT_FALSE(config.ParseVariable("FFPROGRESS_UNKNOWN", "x"));
}

TEST(Config, BadValues)
{
	Config config;
	EXPECT_THROW(config.ParseVariable("FFPROGRESS_COLOR", "sometimes"),
		     std::runtime_error);
	EXPECT_THROW(config.ParseVariable("FFPROGRESS_PROMPT", "maybe"),
		     std::runtime_error);
	EXPECT_THROW(config.ParseVariable("FFPROGRESS_VERBOSE", "loud"),
		     std::runtime_error);
	EXPECT_THROW(config.ParseVariable("FFPROGRESS_VERBOSE", "6"),
		     std::runtime_error);
	EXPECT_THROW(config.ParseVariable("FFPROGRESS_VERBOSE", ""),
		     std::runtime_error);

	/* unchanged */
	EXPECT_EQ(config.color, ColorMode::AUTO);
	EXPECT_TRUE(config.forward_prompts);
	EXPECT_EQ(config.log_level, 1u);

	config.encoder.clear();
	EXPECT_THROW(config.Check(), std::runtime_error);
}

TEST(Config, Environment)
{
	setenv("FFPROGRESS_ENCODER", "avconv", 1);
	setenv("FFPROGRESS_COLOR", "never", 1);
	unsetenv("FFPROGRESS_ENCODING");
	unsetenv("FFPROGRESS_PROMPT");
	setenv("FFPROGRESS_VERBOSE", "0", 1);

	Config config;
	LoadEnvironment(config);
	EXPECT_EQ(config.encoder, "avconv");
	EXPECT_EQ(config.color, ColorMode::NEVER);
	EXPECT_TRUE(config.encoding.empty());
	EXPECT_TRUE(config.forward_prompts);
	EXPECT_EQ(config.log_level, 0u);

	setenv("FFPROGRESS_PROMPT", "perhaps", 1);
	EXPECT_THROW(LoadEnvironment(config), std::runtime_error);

	unsetenv("FFPROGRESS_ENCODER");
	unsetenv("FFPROGRESS_COLOR");
	unsetenv("FFPROGRESS_PROMPT");
	unsetenv("FFPROGRESS_VERBOSE");
}
