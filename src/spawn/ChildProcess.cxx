// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ChildProcess.hxx"
#include "io/Pipe.hxx"
#include "Error.hxx"
#include "Log.hxx"

#include <tuple>
#include <vector>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

static constexpr Logger logger("child");

void
PipeInputChannel::WriteLine(std::string_view line)
{
	if (!fd.IsDefined())
		return;

	try {
		fd.FullWrite(line);
	} catch (const std::system_error &e) {
		if (e.code() != std::errc::broken_pipe)
			throw;

		/* the encoder does not read its input anymore */
		logger(2, "Encoder has closed its input");
		fd.Close();
	}
}

ChildProcess::~ChildProcess() noexcept
{
	Kill(SIGTERM);
}

bool
ChildProcess::TryReap()
{
	if (status)
		return true;

	int s;
	const pid_t result = waitpid(pid, &s, WNOHANG);
	if (result < 0)
		throw MakeErrno("waitpid() failed");

	if (result == 0)
		return false;

	status = s;
	return true;
}

void
ChildProcess::Kill(int signo) noexcept
{
	if (!status)
		kill(pid, signo);
}

int
ChildProcess::GetExitCode() const noexcept
{
	if (WIFSIGNALED(*status))
		return 128 + WTERMSIG(*status);

	return WEXITSTATUS(*status);
}

[[noreturn]]
static void
Exec(const char *program, const char *const*argv,
     int stdin_fd, int stderr_fd, int status_fd) noexcept
{
	/* in the child process: only async-signal-safe calls from
	   here on */

	if (stdin_fd >= 0)
		dup2(stdin_fd, STDIN_FILENO);
	dup2(stderr_fd, STDERR_FILENO);

	/* the parent ignores SIGPIPE, but the encoder should not
	   inherit that */
	signal(SIGPIPE, SIG_DFL);

	/* the parent blocks the signals it receives through a
	   signalfd; the signal mask survives execve() */
	sigset_t mask;
	sigemptyset(&mask);
	sigprocmask(SIG_SETMASK, &mask, nullptr);

	execvp(program, const_cast<char *const*>(argv));

	/* report the error to the parent through the close-on-exec
	   status pipe */
	const int e = errno;
	if (write(status_fd, &e, sizeof(e)) < 0) {
		/* nothing left to report to */
	}

	_exit(127);
}

/**
 * Wait for the result of execvp() on the close-on-exec status pipe.
 *
 * @return 0 on success or the errno value
 */
static int
ReadExecStatus(const UniqueFd &fd)
{
	int e;
	ssize_t nbytes;
	do {
		nbytes = read(fd.Get(), &e, sizeof(e));
	} while (nbytes < 0 && errno == EINTR);

	if (nbytes < 0)
		throw MakeErrno("Failed to read from status pipe");

	return nbytes == sizeof(e) ? e : 0;
}

std::unique_ptr<ChildProcess>
SpawnChildProcess(const char *program,
		  std::span<const char *const> args,
		  bool with_input)
{
	/* build the argument vector before forking */
	std::vector<const char *> argv;
	argv.reserve(args.size() + 2);
	argv.push_back(program);
	argv.insert(argv.end(), args.begin(), args.end());
	argv.push_back(nullptr);

	auto [stderr_r, stderr_w] = CreatePipe();

	UniqueFd stdin_r, stdin_w;
	if (with_input)
		std::tie(stdin_r, stdin_w) = CreatePipe();

	auto [status_r, status_w] = CreatePipe();

	const pid_t pid = fork();
	if (pid < 0)
		throw MakeErrno("fork() failed");

	if (pid == 0)
		Exec(program, argv.data(), stdin_r.Get(), stderr_w.Get(),
		     status_w.Get());

	/* close the child's ends, or we will never see EOF */
	stderr_w.Close();
	stdin_r.Close();
	status_w.Close();

	const int e = ReadExecStatus(status_r);
	if (e != 0) {
		int s;
		while (waitpid(pid, &s, 0) < 0 && errno == EINTR) {}

		throw FmtErrno(e, "Failed to execute '{}'", program);
	}

	logger.Fmt(2, "'{}' running as pid {}", program, pid);

	return std::make_unique<ChildProcess>(pid, std::move(stderr_r),
					      std::move(stdin_w));
}
