// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * Percentage ranges which are drawn in different colors.
 */
enum class ColorBand : uint_least8_t {
	/** [0, 25) */
	STARTING,

	/** [25, 50) */
	LOWER_HALF,

	/** [50, 75) */
	UPPER_HALF,

	/** [75, 95) */
	FINISHING,

	/** [95, 100], and everything beyond */
	ALMOST_DONE,
};

inline constexpr std::size_t N_COLOR_BANDS = 5;

[[gnu::const]]
ColorBand
GetColorBand(double percentage) noexcept;
