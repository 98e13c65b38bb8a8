// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/color.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

struct TerminalStyle;

enum class ProgressUnit : uint_least8_t {
	SECONDS,
	FRAMES,
};

constexpr std::string_view
GetUnitName(ProgressUnit unit) noexcept
{
	switch (unit) {
	case ProgressUnit::SECONDS:
		return "seconds";

	case ProgressUnit::FRAMES:
		return "frames";
	}

	return {};
}

/**
 * Parameters for creating a #ProgressRenderer.
 */
struct BarOptions {
	/**
	 * Shown in front of the bar.
	 */
	std::optional<std::string> label;

	/**
	 * The expected final position; if not set, the bar is
	 * indeterminate.
	 */
	std::optional<uint64_t> total;

	ProgressUnit unit = ProgressUnit::SECONDS;

	const TerminalStyle *style = nullptr;
};

/**
 * Draws a progress indicator.  It is created once per run,
 * advanced any number of times and closed exactly once.
 */
class ProgressRenderer {
public:
	virtual ~ProgressRenderer() noexcept = default;

	/**
	 * Advance the position by the given (positive) amount.
	 */
	virtual void Update(uint64_t delta) = 0;

	/**
	 * The total has become known after the renderer was created.
	 */
	virtual void SetTotal(uint64_t total) = 0;

	/**
	 * Change the style of the bar itself.
	 */
	virtual void SetBarStyle(const fmt::text_style &style) = 0;

	/**
	 * Draw the final state and release the terminal line.
	 */
	virtual void Close() = 0;
};

class RendererFactory {
public:
	virtual ~RendererFactory() noexcept = default;

	virtual std::unique_ptr<ProgressRenderer> CreateRenderer(const BarOptions &options) = 0;
};
