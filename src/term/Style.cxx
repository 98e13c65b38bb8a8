// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Style.hxx"

using fmt::terminal_color;

TerminalStyle
TerminalStyle::Colored() noexcept
{
	TerminalStyle s;
	s.colored = true;

	s.label = fmt::fg(terminal_color::bright_cyan) | fmt::emphasis::bold;
	s.separator = fmt::fg(terminal_color::bright_white);
	s.percentage = fmt::fg(terminal_color::bright_green);
	s.bar = fmt::fg(terminal_color::bright_blue);
	s.counters = fmt::fg(terminal_color::white);
	s.timing = fmt::fg(terminal_color::bright_yellow);
	s.prompt = fmt::fg(terminal_color::bright_yellow) | fmt::emphasis::bold;
	s.error = fmt::fg(terminal_color::bright_red);
	s.error_detail = fmt::fg(terminal_color::bright_white);
	s.exiting = fmt::fg(terminal_color::bright_red) | fmt::emphasis::bold;

	s.bands = {
		fmt::fg(terminal_color::bright_red),
		fmt::fg(terminal_color::bright_yellow),
		fmt::fg(terminal_color::bright_blue),
		fmt::fg(terminal_color::bright_green),
		fmt::fg(terminal_color::green) | fmt::emphasis::bold,
	};

	return s;
}
