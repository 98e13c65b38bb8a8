// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineAccumulator.hxx"

std::optional<std::string_view>
LineAccumulator::Feed(char ch)
{
	if (IsTerminator(ch))
		return ForceComplete();

	buffer.push_back(ch);
	return std::nullopt;
}

std::string_view
LineAccumulator::ForceComplete()
{
	history.push_back(buffer);

	/* clear() keeps the allocation for the next line */
	buffer.clear();

	return history.back();
}

std::optional<std::string_view>
LineAccumulator::Flush()
{
	if (buffer.empty())
		return std::nullopt;

	return ForceComplete();
}
