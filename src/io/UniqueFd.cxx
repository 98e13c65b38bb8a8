// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "UniqueFd.hxx"
#include "Error.hxx"

#include <fcntl.h>

void
UniqueFd::SetNonBlocking()
{
	const int flags = fcntl(fd, F_GETFL);
	if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
		throw MakeErrno("Failed to set O_NONBLOCK");
}

void
UniqueFd::FullWrite(std::span<const char> src) const
{
	while (!src.empty()) {
		const ssize_t nbytes = write(fd, src.data(), src.size());
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw MakeErrno("Failed to write");
		}

		src = src.subspan(nbytes);
	}
}
