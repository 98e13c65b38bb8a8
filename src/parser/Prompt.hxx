// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

/**
 * The suffix ffmpeg prints when it asks a yes/no question, e.g.
 * "File 'out.mp4' already exists. Overwrite? [y/N] ".
 */
inline constexpr std::string_view confirmation_prompt_marker = "[y/N] ";

/**
 * Does the given (unterminated) line end with a confirmation
 * prompt?  This is checked after every byte, because ffmpeg waits
 * for input without printing a line terminator.
 */
constexpr bool
IsConfirmationPrompt(std::string_view partial) noexcept
{
	return partial.ends_with(confirmation_prompt_marker);
}
