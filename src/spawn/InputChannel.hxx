// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

/**
 * The channel for sending responses to the encoder process.
 */
class InputChannel {
public:
	virtual ~InputChannel() noexcept = default;

	/**
	 * Send one line, including its terminator.  Throws on error.
	 */
	virtual void WriteLine(std::string_view line) = 0;

	/**
	 * Signal end of input to the encoder.
	 */
	virtual void Close() noexcept = 0;
};
