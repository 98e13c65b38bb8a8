// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Renderer.hxx"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

struct MediaFacts;
struct TerminalStyle;

/**
 * Converts position updates (in seconds) into renderer updates.
 *
 * The unit is decided on the first position update: frames if the
 * frame rate is known at that point, seconds otherwise.  It is never
 * changed later, even if the frame rate shows up afterwards.
 */
class ProgressEstimator {
	RendererFactory &factory;
	const TerminalStyle &style;

	std::unique_ptr<ProgressRenderer> bar;

	ProgressUnit unit = ProgressUnit::SECONDS;

	/**
	 * Seconds are multiplied with this to obtain the position in
	 * #unit.  Zero until the unit has been locked.
	 */
	unsigned multiplier = 0;

	std::optional<uint64_t> total;

	/**
	 * The position last reported to the renderer.
	 */
	uint64_t position = 0;

	bool closed = false;

public:
	ProgressEstimator(RendererFactory &_factory,
			  const TerminalStyle &_style) noexcept
		:factory(_factory), style(_style) {}

	ProgressEstimator(const ProgressEstimator &) = delete;
	ProgressEstimator &operator=(const ProgressEstimator &) = delete;

	/**
	 * Has the renderer been created?
	 */
	bool HasBar() const noexcept {
		return bar != nullptr;
	}

	ProgressUnit GetUnit() const noexcept {
		return unit;
	}

	const std::optional<uint64_t> &GetTotal() const noexcept {
		return total;
	}

	uint64_t GetPosition() const noexcept {
		return position;
	}

	/**
	 * The encoder has reached the given position.
	 */
	void OnPosition(unsigned elapsed_seconds, const MediaFacts &facts);

	/**
	 * Release the renderer.  This must be called before the
	 * estimator is destroyed.  May be called more than once; only
	 * the first call has an effect.
	 */
	void Close();

private:
	void LockUnit(const MediaFacts &facts) noexcept;
	void CreateBar(const MediaFacts &facts);
};

/**
 * Shorten a label to at most 30 characters (code points), replacing
 * the tail with "...".
 */
std::string
TrimLabel(std::string_view label);
