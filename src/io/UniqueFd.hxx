// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <span>
#include <utility>

#include <sys/types.h>
#include <unistd.h>

/**
 * Owns a file descriptor and closes it in the destructor.
 */
class UniqueFd {
	int fd = -1;

public:
	UniqueFd() noexcept = default;

	explicit UniqueFd(int _fd) noexcept
		:fd(_fd) {}

	UniqueFd(UniqueFd &&src) noexcept
		:fd(std::exchange(src.fd, -1)) {}

	~UniqueFd() noexcept {
		if (IsDefined())
			close(fd);
	}

	UniqueFd &operator=(UniqueFd &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	int Get() const noexcept {
		return fd;
	}

	void Close() noexcept {
		if (IsDefined())
			close(std::exchange(fd, -1));
	}

	/**
	 * Throws on error.
	 */
	void SetNonBlocking();

	/**
	 * @return the number of bytes read, 0 on end of file or -1
	 * on error (with errno set)
	 */
	ssize_t Read(std::span<char> dest) const noexcept {
		return read(fd, dest.data(), dest.size());
	}

	/**
	 * Write the whole buffer, retrying after partial writes and
	 * EINTR.  Throws on error.
	 */
	void FullWrite(std::span<const char> src) const;
};
