// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SignalFd.hxx"
#include "Error.hxx"

#include <sys/signalfd.h>

SignalFd::SignalFd(std::initializer_list<int> signals)
{
	sigset_t mask;
	sigemptyset(&mask);
	for (const int signo : signals)
		sigaddset(&mask, signo);

	if (sigprocmask(SIG_BLOCK, &mask, &old_mask) < 0)
		throw MakeErrno("sigprocmask() failed");

	fd = UniqueFd{signalfd(-1, &mask, SFD_NONBLOCK|SFD_CLOEXEC)};
	if (!fd.IsDefined()) {
		const int e = errno;
		sigprocmask(SIG_SETMASK, &old_mask, nullptr);
		throw MakeErrno(e, "signalfd() failed");
	}
}

SignalFd::~SignalFd() noexcept
{
	fd.Close();
	sigprocmask(SIG_SETMASK, &old_mask, nullptr);
}

int
SignalFd::Read()
{
	struct signalfd_siginfo info;
	const ssize_t nbytes = fd.Read({reinterpret_cast<char *>(&info), sizeof(info)});
	if (nbytes < 0) {
		if (errno == EAGAIN || errno == EINTR)
			return 0;

		throw MakeErrno("Failed to read from signalfd");
	}

	if (std::size_t(nbytes) != sizeof(info))
		throw std::runtime_error("Short read from signalfd");

	return info.ssi_signo;
}
