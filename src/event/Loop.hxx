// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct event_base;

/**
 * Owns a libevent event_base.
 */
class EventLoop {
	struct event_base *const base;

public:
	/**
	 * Throws on error.
	 */
	EventLoop();
	~EventLoop() noexcept;

	EventLoop(const EventLoop &) = delete;
	EventLoop &operator=(const EventLoop &) = delete;

	struct event_base *Get() const noexcept {
		return base;
	}

	/**
	 * Run until Break() is called or no more events are
	 * registered.  Throws on error.
	 */
	void Run();

	/**
	 * Make Run() return after the current callback.
	 */
	void Break() noexcept;
};
