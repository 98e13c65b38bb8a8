// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Session.hxx"
#include "Config.hxx"
#include "Notifier.hxx"
#include "spawn/ChildProcess.hxx"
#include "io/SignalFd.hxx"
#include "term/LineSource.hxx"
#include "term/Probe.hxx"
#include "event/Loop.hxx"
#include "event/Event.hxx"
#include "Error.hxx"
#include "Log.hxx"

#include <fmt/color.h>

#include <errno.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/wait.h>

static constexpr Logger logger("session");

/**
 * The state of one encoder run: the process, the event loop
 * watching its stderr and our signals, and the notifier.
 */
class Session::Stream {
	SessionState &state;

	EventLoop event_loop;

	void OnSignal(evutil_socket_t fd, short events) noexcept;
	void OnStderrReady(evutil_socket_t fd, short events) noexcept;

	/**
	 * Receives SIGINT, SIGTERM and SIGCHLD.  It is also watched
	 * while waiting for a response to a prompt, so a signal
	 * cancels the wait.
	 */
	SignalFd signal_fd;
	BoundEvent<Stream, &Stream::OnSignal> signal_event;

	std::unique_ptr<ChildProcess> child;

	std::optional<BoundEvent<Stream, &Stream::OnStderrReady>> stderr_event;

	std::optional<ProgressNotifier> notifier;

	bool stderr_eof = false;

	/**
	 * The signal which interrupted us, or 0.
	 */
	int interrupt_signal = 0;

	/**
	 * An error which occurred inside an event callback, to be
	 * rethrown by Run().
	 */
	std::exception_ptr error;

public:
	Stream(Session &session, std::span<const char *const> args);

	ExitOutcome Run();

private:
	void CheckDone() noexcept {
		if (stderr_eof && !child->IsRunning())
			event_loop.Break();
	}

	void Fail(std::exception_ptr &&_error) noexcept {
		error = std::move(_error);
		event_loop.Break();
	}
};

Session::Stream::Stream(Session &session, std::span<const char *const> args)
	:state(session.state),
	 /* block the signals before launching the child process,
	    so no signal gets lost */
	 signal_fd({SIGINT, SIGTERM, SIGCHLD}),
	 signal_event(event_loop, signal_fd.Get(), EV_READ|EV_PERSIST, *this)
{
	signal_event.Add();

	child = SpawnChildProcess(session.config.encoder.c_str(), args,
				  session.line_source != nullptr);
	state = SessionState::SPAWNED;

	child->GetStderr().SetNonBlocking();
	stderr_event.emplace(event_loop, child->GetStderr().Get(),
			     EV_READ|EV_PERSIST, *this);
	stderr_event->Add();

	notifier.emplace(session.file, session.style, session.decoder,
			 session.renderer_factory,
			 session.line_source, child->GetInput(),
			 signal_fd.Get());
}

void
Session::Stream::OnSignal(evutil_socket_t, short) noexcept
{
	try {
		while (const int signo = signal_fd.Read()) {
			switch (signo) {
			case SIGINT:
			case SIGTERM:
				interrupt_signal = signo;
				event_loop.Break();
				return;

			case SIGCHLD:
				if (child && child->TryReap())
					CheckDone();
				break;
			}
		}
	} catch (...) {
		Fail(std::current_exception());
	}
}

void
Session::Stream::OnStderrReady(evutil_socket_t, short) noexcept
{
	state = SessionState::STREAMING;

	char buffer[4096];
	const ssize_t nbytes = child->GetStderr().Read(buffer);
	if (nbytes < 0) {
		if (errno == EAGAIN || errno == EINTR)
			return;

		Fail(std::make_exception_ptr(MakeErrno("Failed to read from encoder")));
		return;
	}

	try {
		if (nbytes == 0) {
			stderr_eof = true;
			stderr_event->Delete();

			/* SIGCHLD may have been handled already, or
			   the process may still be running */
			child->TryReap();
			CheckDone();
			return;
		}

		notifier->Feed({buffer, std::size_t(nbytes)});
	} catch (const ReadCancelled &) {
		/* a signal arrived while waiting for a response to a
		   prompt; OnSignal() will handle it */
		logger(3, "stopped waiting for a response");
	} catch (...) {
		Fail(std::current_exception());
	}
}

ExitOutcome
Session::Stream::Run()
{
	try {
		event_loop.Run();

		if (error)
			std::rethrow_exception(error);
	} catch (...) {
		notifier->Close();
		throw;
	}

	if (interrupt_signal != 0) {
		notifier->Close();

		logger.Fmt(2, "interrupted by signal {}, terminating pid {}",
			   interrupt_signal, child->GetPid());
		child->Kill(SIGTERM);

		state = SessionState::INTERRUPTED;
		return {SessionState::INTERRUPTED, interrupt_signal, std::nullopt};
	}

	try {
		notifier->Flush();
	} catch (...) {
		notifier->Close();
		throw;
	}

	notifier->Close();

	const int exit_code = child->GetExitCode();
	if (WIFSIGNALED(child->GetStatus()))
		logger.Fmt(1, "encoder died from signal {}{}",
			   WTERMSIG(child->GetStatus()),
			   WCOREDUMP(child->GetStatus()) ? " (core dumped)" : "");
	else
		logger.Fmt(exit_code == 0 ? 3 : 2,
			   "encoder exited with status {}", exit_code);

	state = SessionState::COMPLETED;
	return {
		SessionState::COMPLETED,
		exit_code,
		exit_code != 0 ? notifier->GetLastLine() : std::nullopt,
	};
}

Session::Session(const Config &_config, FILE *_file,
		 const TerminalStyle &_style,
		 RendererFactory &_renderer_factory,
		 LineSource *_line_source)
	:config(_config), file(_file), style(_style),
	 decoder(config.encoding.empty()
		 ? GetLocaleCharset()
		 : config.encoding),
	 renderer_factory(_renderer_factory),
	 line_source(_line_source)
{
}

bool
WantPromptForwarding(const Config &config, const TerminalProbe &probe,
		     FILE *input) noexcept
{
	if (!config.forward_prompts)
		return false;

	if (!probe.IsTerminal(input)) {
		/* the encoder may be reading media data from it */
		logger(3, "stdin is not a terminal, the encoder inherits it");
		return false;
	}

	return true;
}

inline ExitOutcome
Session::Execute(std::span<const char *const> args)
{
	Stream stream(*this, args);
	return stream.Run();
}

inline int
Session::Finish(const ExitOutcome &outcome)
{
	switch (outcome.state) {
	case SessionState::INTERRUPTED:
		fmt::print(file, style.exiting, "Exiting.");
		fmt::print(file, "\n");
		return 128 + outcome.value;

	default:
		if (outcome.last_line) {
			fmt::print(file, style.error, "{}", *outcome.last_line);
			fmt::print(file, "\n");
		}

		return outcome.value;
	}
}

void
Session::PrintUnexpected(std::exception_ptr e)
{
	fmt::print(file, style.error, "Unexpected exception:");
	fmt::print(file, " ");
	fmt::print(file, style.error_detail, "{}", e);
	fmt::print(file, "\n");
}

int
Session::Run(std::span<const char *const> args)
{
	try {
		return Finish(Execute(args));
	} catch (...) {
		state = SessionState::FAILED;
		PrintUnexpected(std::current_exception());
		return EXIT_FAILURE;
	}
}
