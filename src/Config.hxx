// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

enum class ColorMode : uint_least8_t {
	/** colors if the output is a terminal */
	AUTO,

	ALWAYS,
	NEVER,
};

struct Config {
	/**
	 * The program which gets all command-line arguments.
	 */
	std::string encoder = "ffmpeg";

	ColorMode color = ColorMode::AUTO;

	/**
	 * The character set of the encoder's output.  Empty means the
	 * locale's character set.
	 */
	std::string encoding;

	/**
	 * Read responses to the encoder's prompts from our stdin and
	 * send them to the encoder's stdin?  If disabled, the encoder
	 * inherits our stdin.
	 */
	bool forward_prompts = true;

	unsigned log_level = 1;

	/**
	 * Throws on error.
	 */
	void Check() const;

	/**
	 * Parse the value of one setting.  Throws on error.
	 *
	 * @param name the environment variable name
	 * @return false if the name is not known
	 */
	bool ParseVariable(std::string_view name, const char *value);
};

/**
 * Apply all FFPROGRESS_* environment variables.  Throws on error.
 */
void
LoadEnvironment(Config &config);
