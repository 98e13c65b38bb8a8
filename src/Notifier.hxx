// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "parser/LineAccumulator.hxx"
#include "parser/Facts.hxx"
#include "progress/Estimator.hxx"

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <stdio.h>

struct TerminalStyle;
class TextDecoder;
class RendererFactory;
class LineSource;
class InputChannel;

/**
 * Consumes the encoder's stderr byte by byte: reassembles lines,
 * collects facts, forwards confirmation prompts and keeps the
 * progress bar up to date.
 */
class ProgressNotifier {
	FILE *const file;
	const TerminalStyle &style;
	TextDecoder &decoder;

	/**
	 * Responses to prompts are read from here; nullptr if prompts
	 * are only shown.
	 */
	LineSource *const line_source;

	/**
	 * Responses are sent here; nullptr if the encoder reads our
	 * stdin directly.
	 */
	InputChannel *const input;

	/**
	 * Passed to LineSource::ReadLine(); -1 if waiting for a
	 * response cannot be cancelled.
	 */
	const int cancel_fd;

	LineAccumulator lines;
	MediaFacts facts;
	ProgressEstimator estimator;

public:
	ProgressNotifier(FILE *_file, const TerminalStyle &_style,
			 TextDecoder &_decoder,
			 RendererFactory &renderer_factory,
			 LineSource *_line_source,
			 InputChannel *_input,
			 int _cancel_fd=-1) noexcept;

	ProgressNotifier(const ProgressNotifier &) = delete;
	ProgressNotifier &operator=(const ProgressNotifier &) = delete;

	const LineAccumulator &GetLines() const noexcept {
		return lines;
	}

	const MediaFacts &GetFacts() const noexcept {
		return facts;
	}

	const ProgressEstimator &GetEstimator() const noexcept {
		return estimator;
	}

	/**
	 * Process one byte.  Throws on error; throws #ReadCancelled
	 * if the cancel file descriptor became readable while waiting
	 * for a response to a prompt.
	 */
	void Feed(char ch);

	/**
	 * Process a chunk of bytes.  This is equivalent to calling
	 * Feed(char) for each byte.  Throws on error.
	 */
	void Feed(std::span<const char> src);

	/**
	 * The stream has ended: process the unterminated rest.
	 */
	void Flush();

	/**
	 * Release the progress bar.  Must be called exactly once at
	 * the end of the run, on all code paths.
	 */
	void Close();

	/**
	 * The most recent complete line, decoded.
	 */
	std::optional<std::string> GetLastLine();

private:
	void OnLine(std::string_view line);
	void OnPrompt();
};
