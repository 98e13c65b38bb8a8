// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <stdexcept>
#include <system_error>
#include <utility>

#include <errno.h>

/**
 * Construct a std::system_error from an errno value.
 */
[[nodiscard]]
inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(code, std::system_category(), msg);
}

/**
 * Like MakeErrno(int, const char *), but use the current value of
 * #errno.
 */
[[nodiscard]]
inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

template<typename... Args>
[[nodiscard]]
inline std::runtime_error
FmtRuntimeError(fmt::format_string<Args...> format_str, Args&&... args)
{
	return std::runtime_error{fmt::format(format_str, std::forward<Args>(args)...)};
}

template<typename... Args>
[[nodiscard]]
inline std::system_error
FmtErrno(int code, fmt::format_string<Args...> format_str, Args&&... args)
{
	return MakeErrno(code,
			 fmt::format(format_str, std::forward<Args>(args)...).c_str());
}
