// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "progress/ColorBand.hxx"

#include <fmt/color.h>

#include <array>

/**
 * How each element of the output is decorated.  The plain variant
 * consists of empty styles only, and fmt::format() emits no escape
 * sequences for those.  An instance is chosen once at startup and
 * then passed to everybody who writes to the terminal.
 */
struct TerminalStyle {
	/** the file name in front of the bar */
	fmt::text_style label;

	/** the ": " after the label */
	fmt::text_style separator;

	fmt::text_style percentage;

	/** the bar before the total is known */
	fmt::text_style bar;

	/** "N/TOTAL" */
	fmt::text_style counters;

	/** "[ELAPSED<REMAINING, RATE]" */
	fmt::text_style timing;

	/** an interactive question forwarded from the encoder */
	fmt::text_style prompt;

	/** the encoder's last line after it has failed */
	fmt::text_style error;

	/** the message after "Unexpected exception:" */
	fmt::text_style error_detail;

	/** "Exiting." after an interrupt */
	fmt::text_style exiting;

	/** the bar, depending on the percentage */
	std::array<fmt::text_style, N_COLOR_BANDS> bands;

	bool colored = false;

	[[gnu::const]]
	static TerminalStyle Plain() noexcept {
		return {};
	}

	[[gnu::const]]
	static TerminalStyle Colored() noexcept;

	const fmt::text_style &GetBandStyle(ColorBand band) const noexcept {
		return bands[static_cast<std::size_t>(band)];
	}
};
