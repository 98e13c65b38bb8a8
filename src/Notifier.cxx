// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Notifier.hxx"
#include "parser/Prompt.hxx"
#include "term/Decoder.hxx"
#include "term/LineSource.hxx"
#include "term/Style.hxx"
#include "spawn/InputChannel.hxx"
#include "Error.hxx"
#include "Log.hxx"

#include <fmt/color.h>

static constexpr Logger logger("parser");

ProgressNotifier::ProgressNotifier(FILE *_file, const TerminalStyle &_style,
				   TextDecoder &_decoder,
				   RendererFactory &renderer_factory,
				   LineSource *_line_source,
				   InputChannel *_input,
				   int _cancel_fd) noexcept
	:file(_file), style(_style), decoder(_decoder),
	 line_source(_line_source), input(_input), cancel_fd(_cancel_fd),
	 estimator(renderer_factory, style)
{
}

void
ProgressNotifier::Feed(char ch)
{
	if (const auto line = lines.Feed(ch)) {
		OnLine(*line);
		return;
	}

	if (IsConfirmationPrompt(lines.GetPartial()))
		OnPrompt();
}

void
ProgressNotifier::Feed(std::span<const char> src)
{
	for (const char ch : src)
		Feed(ch);
}

void
ProgressNotifier::Flush()
{
	if (const auto line = lines.Flush())
		OnLine(*line);
}

void
ProgressNotifier::Close()
{
	estimator.Close();
}

std::optional<std::string>
ProgressNotifier::GetLastLine()
{
	const auto *line = lines.GetLastLine();
	if (line == nullptr)
		return std::nullopt;

	return decoder.Decode(*line);
}

void
ProgressNotifier::OnLine(std::string_view line)
{
	if (facts.Update(line, decoder))
		logger.Fmt(3, "duration={} source='{}' fps={}",
			   facts.duration ? fmt::to_string(*facts.duration) : "?",
			   facts.source ? *facts.source : "",
			   facts.fps ? fmt::to_string(*facts.fps) : "?");

	if (const auto position = ExtractPosition(line))
		estimator.OnPosition(*position, facts);
}

void
ProgressNotifier::OnPrompt()
{
	fmt::print(file, style.prompt, "{}", decoder.Decode(lines.GetPartial()));
	if (fflush(file) != 0)
		throw MakeErrno("Failed to write prompt");

	if (line_source != nullptr) {
		if (auto response = line_source->ReadLine(cancel_fd)) {
			if (input != nullptr) {
				response->push_back('\n');
				input->WriteLine(*response);
				logger(4, "forwarded response to the encoder");
			}
		} else if (input != nullptr) {
			/* no more input: let the encoder see EOF
			   instead of waiting forever */
			logger(2, "end of input, closing the encoder's stdin");
			input->Close();
		}
	}

	OnLine(lines.ForceComplete());
}
