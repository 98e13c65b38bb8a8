// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineSource.hxx"
#include "Error.hxx"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <utility>

std::optional<std::string>
FdLineSource::PopLine()
{
	const auto newline = buffer.find('\n');
	if (newline == buffer.npos)
		return std::nullopt;

	std::string line = buffer.substr(0, newline);
	buffer.erase(0, newline + 1);
	return line;
}

void
FdLineSource::WaitReadable(int cancel_fd)
{
	struct pollfd pfds[2] = {
		{.fd = fd, .events = POLLIN, .revents = 0},
		{.fd = cancel_fd, .events = POLLIN, .revents = 0},
	};

	const nfds_t n = cancel_fd >= 0 ? 2 : 1;

	while (true) {
		if (poll(pfds, n, -1) < 0) {
			if (errno == EINTR)
				continue;

			throw MakeErrno("Failed to wait for a response");
		}

		if (n > 1 && pfds[1].revents != 0)
			throw ReadCancelled();

		if (pfds[0].revents != 0)
			return;
	}
}

std::optional<std::string>
FdLineSource::ReadLine(int cancel_fd)
{
	while (!eof) {
		if (auto line = PopLine())
			return line;

		WaitReadable(cancel_fd);

		char data[256];
		const auto nbytes = read(fd, data, sizeof(data));
		if (nbytes < 0) {
			if (errno == EINTR || errno == EAGAIN)
				continue;

			throw MakeErrno("Failed to read response");
		}

		if (nbytes == 0)
			eof = true;
		else
			buffer.append(data, std::size_t(nbytes));
	}

	if (auto line = PopLine())
		return line;

	if (buffer.empty())
		return std::nullopt;

	/* the last line had no terminator */
	std::string line = std::move(buffer);
	buffer.clear();
	return line;
}
