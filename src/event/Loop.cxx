// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Loop.hxx"

#include <event2/event.h>

#include <stdexcept>

EventLoop::EventLoop()
	:base(event_base_new())
{
	if (base == nullptr)
		throw std::runtime_error("event_base_new() failed");
}

EventLoop::~EventLoop() noexcept
{
	event_base_free(base);
}

void
EventLoop::Run()
{
	if (event_base_dispatch(base) < 0)
		throw std::runtime_error("event_base_dispatch() failed");
}

void
EventLoop::Break() noexcept
{
	event_base_loopbreak(base);
}
