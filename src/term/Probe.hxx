// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdio.h>

/**
 * Answers questions about the capabilities of an output stream.
 */
class TerminalProbe {
public:
	virtual ~TerminalProbe() noexcept = default;

	/**
	 * Is the stream attached to a terminal?
	 */
	virtual bool IsTerminal(FILE *stream) const noexcept = 0;

	/**
	 * Is the stream attached to an interactive terminal which
	 * understands ANSI escape sequences?
	 */
	virtual bool IsInteractive(FILE *stream) const noexcept = 0;

	/**
	 * @return the number of columns or 0 if unknown
	 */
	virtual unsigned GetColumns(FILE *stream) const noexcept = 0;
};

class PosixTerminalProbe final : public TerminalProbe {
public:
	bool IsTerminal(FILE *stream) const noexcept override;
	bool IsInteractive(FILE *stream) const noexcept override;
	unsigned GetColumns(FILE *stream) const noexcept override;
};
