// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Loop.hxx"

#include <event2/event.h>

#include <stdexcept>

/**
 * Wrapper for a libevent "struct event" which invokes a method of
 * the given object.  The method must not throw.
 */
template<class T, void (T::*method)(evutil_socket_t fd, short events) noexcept>
class BoundEvent {
	struct event *const event;

public:
	/**
	 * Throws on error.
	 *
	 * @param fd a file descriptor, or a signal number with
	 * EV_SIGNAL
	 */
	BoundEvent(EventLoop &loop, evutil_socket_t fd, short events,
		   T &instance)
		:event(event_new(loop.Get(), fd, events, Callback, &instance))
	{
		if (event == nullptr)
			throw std::runtime_error("event_new() failed");
	}

	~BoundEvent() noexcept {
		event_free(event);
	}

	BoundEvent(const BoundEvent &) = delete;
	BoundEvent &operator=(const BoundEvent &) = delete;

	/**
	 * Throws on error.
	 */
	void Add() {
		if (event_add(event, nullptr) < 0)
			throw std::runtime_error("event_add() failed");
	}

	void Delete() noexcept {
		event_del(event);
	}

private:
	static void Callback(evutil_socket_t fd, short events, void *ctx) noexcept {
		(static_cast<T *>(ctx)->*method)(fd, events);
	}
};
