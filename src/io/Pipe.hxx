// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UniqueFd.hxx"

#include <utility>

/**
 * Create an anonymous pipe with O_CLOEXEC on both ends.  Throws on
 * error.
 *
 * @return the read end and the write end
 */
std::pair<UniqueFd, UniqueFd>
CreatePipe();
