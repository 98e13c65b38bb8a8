// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Renderer.hxx"

#include <fmt/color.h>

#include <chrono>
#include <string>

#include <stdio.h>

struct TerminalStyle;
class TerminalProbe;

/**
 * A single-line progress bar which is redrawn in place using
 * carriage return:
 *
 *   clip.mp4:  10%|▒▒▒       | 250/2500 [00:04<00:36, 62.50 frames/s]
 *
 * Without a total, the bar and the percentage are omitted.
 */
class TerminalBar final : public ProgressRenderer {
	using Clock = std::chrono::steady_clock;

	FILE *const file;

	const TerminalStyle &style;
	fmt::text_style bar_style;

	const std::optional<std::string> label;
	std::optional<uint64_t> total;
	const ProgressUnit unit;

	const unsigned columns;

	/**
	 * Use block characters for the bar?  Otherwise ASCII.
	 */
	const bool unicode;

	const Clock::duration min_interval;

	const Clock::time_point start_time;
	Clock::time_point last_draw;

	uint64_t position = 0;

	/**
	 * The number of columns occupied by the previous drawing; the
	 * next one pads with spaces to cover it.
	 */
	std::size_t last_width = 0;

	bool closed = false;

public:
	TerminalBar(FILE *_file, const BarOptions &options,
		    unsigned _columns, bool _unicode,
		    Clock::duration _min_interval=std::chrono::milliseconds(100));

	uint64_t GetPosition() const noexcept {
		return position;
	}

	/**
	 * Render the line (without carriage return and padding).
	 *
	 * @param elapsed the time since the bar was created
	 * @param width receives the number of visible columns
	 */
	std::string Format(Clock::duration elapsed,
			   std::size_t &width) const;

	/* virtual methods from ProgressRenderer */
	void Update(uint64_t delta) override;
	void SetTotal(uint64_t _total) override;
	void SetBarStyle(const fmt::text_style &_style) override;
	void Close() override;

private:
	void Draw(bool force);
	void Flush();
};

class TerminalBarFactory final : public RendererFactory {
	FILE *const file;
	const TerminalProbe &probe;
	const bool unicode;

public:
	TerminalBarFactory(FILE *_file, const TerminalProbe &_probe,
			   bool _unicode) noexcept
		:file(_file), probe(_probe), unicode(_unicode) {}

	std::unique_ptr<ProgressRenderer> CreateRenderer(const BarOptions &options) override;
};

/**
 * Format a duration like "05:07" or "1:05:07".
 */
std::string
FormatInterval(std::chrono::seconds s);

/**
 * Count the code points in a UTF-8 string.
 */
[[gnu::pure]]
std::size_t
CountColumns(std::string_view s) noexcept;
