// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Probe.hxx"

#include <string.h>
#include <stdlib.h>
#include <sys/ioctl.h>
#include <unistd.h>

bool
PosixTerminalProbe::IsTerminal(FILE *stream) const noexcept
{
	return isatty(fileno(stream));
}

bool
PosixTerminalProbe::IsInteractive(FILE *stream) const noexcept
{
	if (!IsTerminal(stream))
		return false;

	/* a terminal which does not interpret escape sequences */
	const char *term = getenv("TERM");
	return term == nullptr || strcmp(term, "dumb") != 0;
}

unsigned
PosixTerminalProbe::GetColumns(FILE *stream) const noexcept
{
	struct winsize ws;
	if (ioctl(fileno(stream), TIOCGWINSZ, &ws) < 0)
		return 0;

	return ws.ws_col;
}
