// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TerminalBar.hxx"
#include "term/Probe.hxx"
#include "term/Style.hxx"
#include "Error.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <cassert>

using std::string_literals::operator""s;
using std::string_view_literals::operator""sv;

static constexpr unsigned default_columns = 80;
static constexpr std::size_t max_bar_width = 100;

std::size_t
CountColumns(std::string_view s) noexcept
{
	std::size_t n = 0;
	for (const char ch : s)
		if ((static_cast<unsigned char>(ch) & 0xc0) != 0x80)
			++n;
	return n;
}

std::string
FormatInterval(std::chrono::seconds s)
{
	const auto total = s.count() > 0 ? s.count() : 0;
	const auto hours = total / 3600;
	const auto minutes = (total / 60) % 60;
	const auto seconds = total % 60;

	if (hours > 0)
		return fmt::format("{}:{:02}:{:02}", hours, minutes, seconds);

	return fmt::format("{:02}:{:02}", minutes, seconds);
}

namespace {

/**
 * Collects styled fragments and counts the visible columns.
 */
class LineBuilder {
	std::string text;
	std::size_t width = 0;

public:
	void Append(const fmt::text_style &style, std::string_view s) {
		if (s.empty())
			return;

		text += fmt::format(style, "{}", s);
		width += CountColumns(s);
	}

	void Append(std::string_view s) {
		text += s;
		width += CountColumns(s);
	}

	std::size_t GetWidth() const noexcept {
		return width;
	}

	std::string &&Steal(std::size_t &_width) noexcept {
		_width = width;
		return std::move(text);
	}
};

} // anonymous namespace

TerminalBar::TerminalBar(FILE *_file, const BarOptions &options,
			 unsigned _columns, bool _unicode,
			 Clock::duration _min_interval)
	:file(_file), style(*options.style), bar_style(style.bar),
	 label(options.label), total(options.total), unit(options.unit),
	 columns(_columns > 0 ? _columns : default_columns),
	 unicode(_unicode),
	 min_interval(_min_interval),
	 start_time(Clock::now())
{
	Draw(true);
}

std::string
TerminalBar::Format(Clock::duration elapsed, std::size_t &width) const
{
	const auto elapsed_s =
		std::chrono::duration_cast<std::chrono::seconds>(elapsed);
	const double elapsed_f =
		std::chrono::duration_cast<std::chrono::duration<double>>(elapsed).count();

	const auto unit_name = GetUnitName(unit);
	const double rate = elapsed_f > 0 ? position / elapsed_f : 0;

	const std::string rate_text = rate > 0
		? fmt::format("{:.2f} {}/s", rate, unit_name)
		: fmt::format("? {}/s", unit_name);

	LineBuilder line;

	if (label && !label->empty()) {
		line.Append(style.label, *label);
		line.Append(style.separator, ": "sv);
	}

	if (!total) {
		line.Append(style.counters,
			    fmt::format("{} {}", position, unit_name));
		line.Append(style.timing,
			    fmt::format(" [{}, {}]",
					FormatInterval(elapsed_s), rate_text));
		return line.Steal(width);
	}

	const double fraction = *total > 0
		? std::min(double(position) / double(*total), 1.0)
		: 1.0;

	const std::string remaining = rate > 0 && *total > position
		? FormatInterval(std::chrono::seconds(uint64_t((*total - position) / rate)))
		: (*total > position ? "?"s : FormatInterval({}));

	const std::string counters = fmt::format(" {}/{}", position, *total);
	const std::string timing = fmt::format(" [{}<{}, {}]",
					       FormatInterval(elapsed_s),
					       remaining, rate_text);

	/* the bar gets whatever space is left */
	const std::size_t fixed = line.GetWidth() + 5 /* "100%|" */
		+ 1 /* "|" */ + CountColumns(counters) + CountColumns(timing);
	const std::size_t bar_width = columns > fixed
		? std::min<std::size_t>(columns - fixed, max_bar_width)
		: 0;
	const std::size_t filled = std::size_t(fraction * bar_width);

	std::string bar;
	const std::string_view fill = unicode ? "\xe2\x96\x92"sv : "#"sv;
	for (std::size_t i = 0; i < filled; ++i)
		bar += fill;
	bar.append(bar_width - filled, ' ');

	line.Append(style.percentage,
		    fmt::format("{:3.0f}%", fraction * 100));
	line.Append("|"sv);
	line.Append(bar_style, bar);
	line.Append("|"sv);
	line.Append(style.counters, counters);
	line.Append(style.timing, timing);

	return line.Steal(width);
}

void
TerminalBar::Draw(bool force)
{
	assert(!closed);

	const auto now = Clock::now();
	if (!force && now - last_draw < min_interval)
		return;

	last_draw = now;

	std::size_t width;
	const std::string text = Format(now - start_time, width);

	const std::size_t padding = last_width > width ? last_width - width : 0;
	last_width = width;

	fmt::print(file, "\r{}{:{}}", text, "", padding);
	Flush();
}

void
TerminalBar::Flush()
{
	if (fflush(file) != 0)
		throw MakeErrno("Failed to write progress bar");
}

void
TerminalBar::Update(uint64_t delta)
{
	position += delta;
	Draw(false);
}

void
TerminalBar::SetTotal(uint64_t _total)
{
	total = _total;
	Draw(true);
}

void
TerminalBar::SetBarStyle(const fmt::text_style &_style)
{
	bar_style = _style;
}

void
TerminalBar::Close()
{
	if (closed)
		return;

	Draw(true);
	closed = true;

	fmt::print(file, "\n");
	Flush();
}

std::unique_ptr<ProgressRenderer>
TerminalBarFactory::CreateRenderer(const BarOptions &options)
{
	return std::make_unique<TerminalBar>(file, options,
					     probe.GetColumns(file),
					     unicode);
}
