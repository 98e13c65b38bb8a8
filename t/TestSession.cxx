// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FakeRenderer.hxx"
#include "Session.hxx"
#include "Config.hxx"
#include "term/LineSource.hxx"
#include "term/Probe.hxx"
#include "term/Style.hxx"
#include "io/Pipe.hxx"

#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <stdexcept>
#include <string>

#include <signal.h>
#include <stdio.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

class CannedLineSource final : public LineSource {
public:
	std::deque<std::string> lines;

	std::optional<std::string> ReadLine(int) override {
		if (lines.empty())
			return std::nullopt;

		auto line = std::move(lines.front());
		lines.pop_front();
		return line;
	}
};

/**
 * Runs a shell script as the encoder.
 */
struct ShellSession {
	FILE *const file = tmpfile();
	const TerminalStyle style = TerminalStyle::Plain();
	Config config;
	FakeRendererFactory factory;
	CannedLineSource line_source;

	/**
	 * Passed to the #Session; nullptr lets the encoder inherit
	 * our stdin.
	 */
	LineSource *input = &line_source;

	ShellSession() {
		if (file == nullptr)
			throw std::runtime_error("tmpfile() failed");

		config.encoder = "/bin/sh";
		config.encoding = "UTF-8";
	}

	~ShellSession() noexcept {
		fclose(file);
	}

	int Run(const char *script, SessionState &state_r) {
		Session session(config, file, style, factory, input);
		const char *const args[] = {"-c", script};
		const int result = session.Run(args);
		state_r = session.GetState();
		return result;
	}

	std::string ReadOutput() const {
		fflush(file);
		rewind(file);

		std::string result;
		int ch;
		while ((ch = getc(file)) != EOF)
			result.push_back(static_cast<char>(ch));
		return result;
	}
};

TEST(Session, Success)
{
	ShellSession s;
	SessionState state;

	const int result = s.Run("printf '  Duration: 00:00:04.00, start: 0.000000\\n"
				 "size=N/A time=00:00:02.00\\r"
				 "size=N/A time=00:00:04.00\\r' >&2",
				 state);
	EXPECT_EQ(result, 0);
	EXPECT_EQ(state, SessionState::COMPLETED);

	EXPECT_EQ(s.factory.log.n_created, 1u);
	EXPECT_EQ(s.factory.log.n_closed, 1u);
	EXPECT_EQ(s.factory.log.options.unit, ProgressUnit::SECONDS);
	EXPECT_EQ(s.factory.log.options.total, 4u);
	EXPECT_EQ(s.factory.log.GetPosition(), 4u);

	EXPECT_TRUE(s.ReadOutput().empty());
}

TEST(Session, UnterminatedLastLine)
{
	ShellSession s;
	SessionState state;

	const int result = s.Run("printf 'size=N/A time=00:00:07.00' >&2", state);
	EXPECT_EQ(result, 0);
	EXPECT_EQ(s.factory.log.n_created, 1u);
	EXPECT_EQ(s.factory.log.n_closed, 1u);
	EXPECT_EQ(s.factory.log.GetPosition(), 7u);
}

TEST(Session, EncoderFailure)
{
	ShellSession s;
	SessionState state;

	const int result = s.Run("echo 'ffmpeg version 6.0' >&2; "
				 "echo 'nope.mp4: No such file or directory' >&2; "
				 "exit 1",
				 state);
	EXPECT_EQ(result, 1);
	EXPECT_EQ(state, SessionState::COMPLETED);
	EXPECT_EQ(s.factory.log.n_created, 0u);
	EXPECT_EQ(s.factory.log.n_closed, 0u);

	EXPECT_EQ(s.ReadOutput(), "nope.mp4: No such file or directory\n");
}

TEST(Session, ExitCode)
{
	ShellSession s;
	SessionState state;

	/* no output at all */
	EXPECT_EQ(s.Run("exit 42", state), 42);
	EXPECT_EQ(state, SessionState::COMPLETED);
	EXPECT_TRUE(s.ReadOutput().empty());
}

TEST(Session, KilledBySignal)
{
	ShellSession s;
	SessionState state;

	EXPECT_EQ(s.Run("kill -TERM $$", state), 128 + SIGTERM);
	EXPECT_EQ(state, SessionState::COMPLETED);
}

TEST(Session, Interrupt)
{
	ShellSession s;
	SessionState state;

	const int result = s.Run("printf 'size=N/A time=00:00:01.00\\r' >&2; "
				 "sleep 0.5; "
				 "kill -INT $PPID; "
				 "exec sleep 10",
				 state);
	EXPECT_EQ(result, 128 + SIGINT);
	EXPECT_EQ(state, SessionState::INTERRUPTED);

	EXPECT_EQ(s.factory.log.n_created, 1u);
	EXPECT_EQ(s.factory.log.n_closed, 1u);

	EXPECT_EQ(s.ReadOutput(), "Exiting.\n");
}

TEST(Session, LaunchFailure)
{
	ShellSession s;
	s.config.encoder = "/nonexistent/ffprogress-encoder";
	SessionState state;

	EXPECT_EQ(s.Run("exit 0", state), 1);
	EXPECT_EQ(state, SessionState::FAILED);
	EXPECT_EQ(s.factory.log.n_created, 0u);

	const auto output = s.ReadOutput();
	EXPECT_EQ(output.find("Unexpected exception: "), 0u);
	EXPECT_NE(output.find("Failed to execute '/nonexistent/ffprogress-encoder'"),
		  output.npos);
	EXPECT_EQ(output.back(), '\n');
}

TEST(Session, Prompt)
{
	/* the script may exit before reading our response */
	signal(SIGPIPE, SIG_IGN);

	ShellSession s;
	s.line_source.lines.emplace_back("y");
	SessionState state;

	const int result = s.Run("printf \"File 'out.mp4' already exists. Overwrite? [y/N] \" >&2; "
				 "read answer; "
				 "echo \"answer=$answer\" >&2; "
				 "exit 3",
				 state);
	EXPECT_EQ(result, 3);

	const auto output = s.ReadOutput();
	EXPECT_EQ(output,
		  "File 'out.mp4' already exists. Overwrite? [y/N] "
		  "answer=y\n");
}

TEST(Session, PromptEndOfInput)
{
	signal(SIGPIPE, SIG_IGN);

	ShellSession s;
	SessionState state;

	/* no response available: the encoder's stdin is closed */
	const int result = s.Run("printf 'Overwrite? [y/N] ' >&2; "
				 "if read answer; then exit 0; fi; "
				 "echo 'Not overwriting - exiting' >&2; "
				 "exit 1",
				 state);
	EXPECT_EQ(result, 1);

	const auto output = s.ReadOutput();
	EXPECT_EQ(output, "Overwrite? [y/N] Not overwriting - exiting\n");
}

TEST(Session, InterruptAtPrompt)
{
	/* nobody ever answers: the write end stays open */
	auto [r, w] = CreatePipe();
	FdLineSource answers(r.Get());

	ShellSession s;
	s.input = &answers;
	SessionState state;

	const auto start = std::chrono::steady_clock::now();
	const int result = s.Run("printf 'Overwrite? [y/N] ' >&2; "
				 "sleep 0.3; "
				 "kill -INT $PPID; "
				 "exec sleep 10",
				 state);
	const auto duration = std::chrono::steady_clock::now() - start;

	EXPECT_EQ(result, 128 + SIGINT);
	EXPECT_EQ(state, SessionState::INTERRUPTED);
	EXPECT_LT(duration, std::chrono::seconds(2));

	EXPECT_EQ(s.ReadOutput(), "Overwrite? [y/N] Exiting.\n");
}

/**
 * Replaces our stdin with the read end of a pipe filled with the
 * given data for the lifetime of this object.
 */
class StdinReplacement {
	UniqueFd saved{dup(STDIN_FILENO)};

public:
	explicit StdinReplacement(std::string_view data) {
		if (!saved.IsDefined())
			throw std::runtime_error("dup() failed");

		auto [r, w] = CreatePipe();
		w.FullWrite(data);
		w.Close();

		if (dup2(r.Get(), STDIN_FILENO) < 0)
			throw std::runtime_error("dup2() failed");
	}

	~StdinReplacement() noexcept {
		dup2(saved.Get(), STDIN_FILENO);
	}
};

TEST(Session, InheritedInput)
{
	const StdinReplacement stdin_replacement("hello world\n"sv);

	ShellSession s;
	s.input = nullptr;
	SessionState state;

	/* the encoder reads our stdin directly until EOF */
	EXPECT_EQ(s.Run("n=$(wc -c); exit $n", state), 12);
	EXPECT_EQ(state, SessionState::COMPLETED);
	EXPECT_EQ(s.factory.log.n_created, 0u);
}

class FakeTerminal final : public TerminalProbe {
public:
	bool is_terminal = false;

	bool IsTerminal(FILE *) const noexcept override {
		return is_terminal;
	}

	bool IsInteractive(FILE *) const noexcept override {
		return is_terminal;
	}

	unsigned GetColumns(FILE *) const noexcept override {
		return 0;
	}
};

TEST(Session, WantPromptForwarding)
{
	Config config;
	FakeTerminal terminal;

	config.forward_prompts = true;
	terminal.is_terminal = true;
	EXPECT_TRUE(WantPromptForwarding(config, terminal, stdin));

	/* piped media data belongs to the encoder */
	terminal.is_terminal = false;
	EXPECT_FALSE(WantPromptForwarding(config, terminal, stdin));

	config.forward_prompts = false;
	terminal.is_terminal = true;
	EXPECT_FALSE(WantPromptForwarding(config, terminal, stdin));
}
