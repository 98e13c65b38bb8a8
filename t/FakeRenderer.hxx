// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "progress/Renderer.hxx"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * Records everything the estimator asks a renderer to do.
 */
struct RendererLog {
	unsigned n_created = 0;
	unsigned n_closed = 0;

	BarOptions options;

	std::vector<uint64_t> deltas;
	std::vector<uint64_t> totals;
	std::vector<fmt::text_style> bar_styles;

	uint64_t GetPosition() const noexcept {
		uint64_t position = 0;
		for (const auto i : deltas)
			position += i;
		return position;
	}
};

class FakeRenderer final : public ProgressRenderer {
	RendererLog &log;

public:
	explicit FakeRenderer(RendererLog &_log) noexcept
		:log(_log) {}

	void Update(uint64_t delta) override {
		log.deltas.push_back(delta);
	}

	void SetTotal(uint64_t total) override {
		log.totals.push_back(total);
	}

	void SetBarStyle(const fmt::text_style &style) override {
		log.bar_styles.push_back(style);
	}

	void Close() override {
		++log.n_closed;
	}
};

class FakeRendererFactory final : public RendererFactory {
public:
	RendererLog log;

	std::unique_ptr<ProgressRenderer> CreateRenderer(const BarOptions &options) override {
		++log.n_created;
		log.options = options;
		return std::make_unique<FakeRenderer>(log);
	}
};
