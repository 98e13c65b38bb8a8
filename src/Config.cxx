// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "Error.hxx"

#include <stdexcept>

#include <stdlib.h>
#include <string.h>

using std::string_view_literals::operator""sv;

static constexpr const char *variable_names[] = {
	"FFPROGRESS_ENCODER",
	"FFPROGRESS_COLOR",
	"FFPROGRESS_ENCODING",
	"FFPROGRESS_PROMPT",
	"FFPROGRESS_VERBOSE",
};

static bool
ParseBool(const char *value)
{
	if (strcmp(value, "yes") == 0 || strcmp(value, "1") == 0 ||
	    strcmp(value, "true") == 0)
		return true;

	if (strcmp(value, "no") == 0 || strcmp(value, "0") == 0 ||
	    strcmp(value, "false") == 0)
		return false;

	throw std::runtime_error("yes/no expected");
}

static ColorMode
ParseColorMode(const char *value)
{
	if (strcmp(value, "auto") == 0)
		return ColorMode::AUTO;
	else if (strcmp(value, "always") == 0)
		return ColorMode::ALWAYS;
	else if (strcmp(value, "never") == 0)
		return ColorMode::NEVER;
	else
		throw std::runtime_error("'auto', 'always' or 'never' expected");
}

static unsigned
ParseLogLevel(const char *value)
{
	char *endptr;
	const unsigned long level = strtoul(value, &endptr, 10);
	if (endptr == value || *endptr != 0)
		throw std::runtime_error("Failed to parse number");

	if (level > 5)
		throw std::runtime_error("Log level out of range");

	return level;
}

bool
Config::ParseVariable(std::string_view name, const char *value)
{
	try {
		if (name == "FFPROGRESS_ENCODER"sv)
			encoder = value;
		else if (name == "FFPROGRESS_COLOR"sv)
			color = ParseColorMode(value);
		else if (name == "FFPROGRESS_ENCODING"sv)
			encoding = value;
		else if (name == "FFPROGRESS_PROMPT"sv)
			forward_prompts = ParseBool(value);
		else if (name == "FFPROGRESS_VERBOSE"sv)
			log_level = ParseLogLevel(value);
		else
			return false;
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Bad value for {}: '{}'",
						       name, value));
	}

	return true;
}

void
Config::Check() const
{
	if (encoder.empty())
		throw std::runtime_error("Empty encoder program name");
}

void
LoadEnvironment(Config &config)
{
	for (const char *name : variable_names)
		if (const char *value = getenv(name); value != nullptr)
			config.ParseVariable(name, value);
}
