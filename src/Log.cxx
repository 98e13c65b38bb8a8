// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Log.hxx"
#include "config.h"

#include <stdio.h>

static unsigned log_level = 1;

void
SetLogLevel(unsigned level) noexcept
{
	log_level = level;
}

unsigned
GetLogLevel() noexcept
{
	return log_level;
}

void
LogLine(std::string_view domain, std::string_view msg)
{
	if (domain.empty())
		fmt::print(stderr, PACKAGE ": {}\n", msg);
	else
		fmt::print(stderr, PACKAGE ": [{}] {}\n", domain, msg);
}
