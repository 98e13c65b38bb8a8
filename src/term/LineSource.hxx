// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

/**
 * Thrown by LineSource::ReadLine() when the cancel file descriptor
 * became readable before a line was complete.
 */
class ReadCancelled : public std::runtime_error {
public:
	ReadCancelled()
		:std::runtime_error("Read cancelled") {}
};

/**
 * Where responses to the encoder's questions come from.
 */
class LineSource {
public:
	virtual ~LineSource() noexcept = default;

	/**
	 * Read one line (without the line terminator).  This may
	 * block.  Throws on error.
	 *
	 * @param cancel_fd if this file descriptor becomes readable
	 * while waiting, #ReadCancelled is thrown; -1 to wait
	 * indefinitely
	 * @return the line or std::nullopt on end of input
	 */
	virtual std::optional<std::string> ReadLine(int cancel_fd) = 0;
};

/**
 * Reads lines from a file descriptor, usually stdin.  Bytes after
 * the returned line are kept for the next call.
 */
class FdLineSource final : public LineSource {
	const int fd;

	std::string buffer;

	bool eof = false;

public:
	explicit FdLineSource(int _fd) noexcept
		:fd(_fd) {}

	std::optional<std::string> ReadLine(int cancel_fd) override;

private:
	std::optional<std::string> PopLine();
	void WaitReadable(int cancel_fd);
};
