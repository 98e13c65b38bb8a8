// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ColorBand.hxx"

ColorBand
GetColorBand(double percentage) noexcept
{
	if (percentage < 25)
		return ColorBand::STARTING;
	else if (percentage < 50)
		return ColorBand::LOWER_HALF;
	else if (percentage < 75)
		return ColorBand::UPPER_HALF;
	else if (percentage < 95)
		return ColorBand::FINISHING;
	else
		return ColorBand::ALMOST_DONE;
}
