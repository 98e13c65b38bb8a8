// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "Session.hxx"
#include "Log.hxx"
#include "term/Decoder.hxx"
#include "term/LineSource.hxx"
#include "term/Probe.hxx"
#include "term/Style.hxx"
#include "progress/TerminalBar.hxx"
#include "config.h"

#include <fmt/format.h>

#include <locale.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

static constexpr Logger logger("main");

static bool
UseColors(ColorMode mode, const TerminalProbe &probe, FILE *file) noexcept
{
	switch (mode) {
	case ColorMode::ALWAYS:
		return true;

	case ColorMode::NEVER:
		return false;

	case ColorMode::AUTO:
		break;
	}

	return probe.IsInteractive(file);
}

int
main(int argc, char **argv)
try {
	setlocale(LC_CTYPE, "");

	/* a closed pipe to the encoder shall not kill us; the child
	   process restores the default */
	signal(SIGPIPE, SIG_IGN);

	/* configuration */

	Config config;
	LoadEnvironment(config);
	config.Check();

	SetLogLevel(config.log_level);
	logger.Fmt(3, "{} v{}", PACKAGE, VERSION);

	/* set up */

	PosixTerminalProbe probe;
	const TerminalStyle style = UseColors(config.color, probe, stderr)
		? TerminalStyle::Colored()
		: TerminalStyle::Plain();

	TerminalBarFactory renderer_factory(stderr, probe,
					    IsUTF8Charset(GetLocaleCharset()));

	FdLineSource line_source(STDIN_FILENO);

	Session session(config, stderr, style, renderer_factory,
			WantPromptForwarding(config, probe, stdin)
			? &line_source
			: nullptr);

	/* run */

	return session.Run({argv + 1, static_cast<std::size_t>(argc - 1)});
} catch (...) {
	fmt::print(stderr, "Unexpected exception: {}\n",
		   std::current_exception());
	return EXIT_FAILURE;
}
