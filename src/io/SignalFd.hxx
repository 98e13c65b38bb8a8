// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UniqueFd.hxx"

#include <initializer_list>

#include <signal.h>

/**
 * Blocks a set of signals and receives them through a signalfd
 * instead, so they can be handled by the event loop and can wake up
 * poll().  The destructor restores the previous signal mask.
 */
class SignalFd {
	sigset_t old_mask;

	UniqueFd fd;

public:
	/**
	 * Throws on error.
	 */
	explicit SignalFd(std::initializer_list<int> signals);
	~SignalFd() noexcept;

	SignalFd(const SignalFd &) = delete;
	SignalFd &operator=(const SignalFd &) = delete;

	/**
	 * The file descriptor becomes readable while a signal is
	 * pending.
	 */
	int Get() const noexcept {
		return fd.Get();
	}

	/**
	 * Receive one pending signal.  Throws on error.
	 *
	 * @return the signal number or 0 if none is pending
	 */
	int Read();
};
