// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "InputChannel.hxx"
#include "io/UniqueFd.hxx"

#include <memory>
#include <optional>
#include <span>

#include <sys/types.h>

/**
 * Writes to the stdin pipe of a child process.
 */
class PipeInputChannel final : public InputChannel {
	UniqueFd fd;

public:
	PipeInputChannel() noexcept = default;

	explicit PipeInputChannel(UniqueFd &&_fd) noexcept
		:fd(std::move(_fd)) {}

	bool IsDefined() const noexcept {
		return fd.IsDefined();
	}

	/* virtual methods from InputChannel */
	void WriteLine(std::string_view line) override;

	void Close() noexcept override {
		fd.Close();
	}
};

/**
 * A running encoder process.  Its stderr is connected to a pipe;
 * stdout is inherited.
 */
class ChildProcess final {
	const pid_t pid;

	UniqueFd stderr_pipe;

	PipeInputChannel input;

	/**
	 * The wait status after the process has been reaped.
	 */
	std::optional<int> status;

public:
	ChildProcess(pid_t _pid, UniqueFd &&_stderr_pipe,
		     UniqueFd &&_stdin_pipe) noexcept
		:pid(_pid), stderr_pipe(std::move(_stderr_pipe)),
		 input(std::move(_stdin_pipe)) {}

	/**
	 * Sends SIGTERM if the process has not been reaped yet.
	 */
	~ChildProcess() noexcept;

	ChildProcess(const ChildProcess &) = delete;
	ChildProcess &operator=(const ChildProcess &) = delete;

	pid_t GetPid() const noexcept {
		return pid;
	}

	/**
	 * The read end of the child's stderr pipe.
	 */
	UniqueFd &GetStderr() noexcept {
		return stderr_pipe;
	}

	/**
	 * The child's stdin, or nullptr if it inherited ours.
	 */
	InputChannel *GetInput() noexcept {
		return input.IsDefined() ? &input : nullptr;
	}

	bool IsRunning() const noexcept {
		return !status;
	}

	/**
	 * Check (without blocking) whether the process has exited.
	 * Throws on error.
	 *
	 * @return true if the process has been reaped
	 */
	bool TryReap();

	/**
	 * Send a signal unless the process has already been reaped.
	 */
	void Kill(int signo) noexcept;

	/**
	 * The raw wait status.  Only valid after the process has been
	 * reaped.
	 */
	int GetStatus() const noexcept {
		return *status;
	}

	/**
	 * The exit code as a shell would report it: the exit status,
	 * or 128 plus the signal number if the process was killed.
	 * Only valid after the process has been reaped.
	 */
	[[gnu::pure]]
	int GetExitCode() const noexcept;
};

/**
 * Launch a program with the given arguments (without argv[0]),
 * looking it up in $PATH.  Throws if the program could not be
 * executed.
 *
 * @param with_input connect the child's stdin to a pipe (see
 * ChildProcess::GetInput()); otherwise it inherits ours
 */
std::unique_ptr<ChildProcess>
SpawnChildProcess(const char *program,
		  std::span<const char *const> args,
		  bool with_input);
