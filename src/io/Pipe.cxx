// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Pipe.hxx"
#include "Error.hxx"

#include <fcntl.h>
#include <unistd.h>

std::pair<UniqueFd, UniqueFd>
CreatePipe()
{
	int fds[2];
	if (pipe2(fds, O_CLOEXEC) < 0)
		throw MakeErrno("pipe() failed");

	return {UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}
