// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "term/Decoder.hxx"
#include "term/Style.hxx"

#include <cstdint>
#include <exception>
#include <optional>
#include <span>
#include <string>

#include <stdio.h>

struct Config;
class RendererFactory;
class LineSource;
class TerminalProbe;

enum class SessionState : uint_least8_t {
	IDLE,

	/** the encoder process has been launched */
	SPAWNED,

	/** reading the encoder's stderr */
	STREAMING,

	/** the encoder has exited */
	COMPLETED,

	/** we received SIGINT or SIGTERM */
	INTERRUPTED,

	/** an unexpected error occurred */
	FAILED,
};

/**
 * How a run ended (unless it failed with an exception).
 */
struct ExitOutcome {
	SessionState state;

	/**
	 * The encoder's exit code (#COMPLETED) or the signal we
	 * received (#INTERRUPTED).
	 */
	int value;

	/**
	 * The encoder's last line of output if it has failed.
	 */
	std::optional<std::string> last_line;
};

/**
 * Runs the encoder once and shows its progress.
 */
class Session {
	const Config &config;

	/**
	 * Progress, prompts and messages are written here.
	 */
	FILE *const file;

	const TerminalStyle &style;

	TextDecoder decoder;

	RendererFactory &renderer_factory;

	/**
	 * Responses to the encoder's prompts are read from here;
	 * nullptr if the encoder shall read our stdin directly.
	 */
	LineSource *const line_source;

	SessionState state = SessionState::IDLE;

	class Stream;

public:
	/**
	 * Throws if the configured text encoding is not supported.
	 */
	Session(const Config &_config, FILE *_file,
		const TerminalStyle &_style,
		RendererFactory &_renderer_factory,
		LineSource *_line_source);

	SessionState GetState() const noexcept {
		return state;
	}

	/**
	 * Run the encoder with the given arguments until it exits or
	 * until we are interrupted, and print the final message.
	 *
	 * @return the exit code for this process
	 */
	int Run(std::span<const char *const> args);

private:
	ExitOutcome Execute(std::span<const char *const> args);
	int Finish(const ExitOutcome &outcome);
	void PrintUnexpected(std::exception_ptr error);
};

/**
 * Shall responses to the encoder's prompts be read from our stdin
 * and sent through a pipe?  Only if enabled and if stdin is a
 * terminal; otherwise the encoder inherits our stdin.
 */
bool
WantPromptForwarding(const Config &config, const TerminalProbe &probe,
		     FILE *input) noexcept;
