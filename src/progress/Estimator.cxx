// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Estimator.hxx"
#include "ColorBand.hxx"
#include "parser/Facts.hxx"
#include "term/Style.hxx"
#include "Log.hxx"

static constexpr Logger logger("progress");

static constexpr std::size_t max_label_length = 30;

/**
 * Is this the first byte of a UTF-8 sequence?
 */
static constexpr bool
IsLeadingByte(char ch) noexcept
{
	return (static_cast<unsigned char>(ch) & 0xc0) != 0x80;
}

std::string
TrimLabel(std::string_view label)
{
	std::size_t n_chars = 0, cut = label.size();

	for (std::size_t i = 0; i < label.size(); ++i) {
		if (!IsLeadingByte(label[i]))
			continue;

		if (n_chars == max_label_length - 3)
			cut = i;

		if (++n_chars > max_label_length) {
			std::string result{label.substr(0, cut)};
			result += "...";
			return result;
		}
	}

	return std::string{label};
}

inline void
ProgressEstimator::LockUnit(const MediaFacts &facts) noexcept
{
	if (facts.fps && *facts.fps > 0) {
		unit = ProgressUnit::FRAMES;
		multiplier = *facts.fps;
	} else {
		unit = ProgressUnit::SECONDS;
		multiplier = 1;
	}

	if (facts.duration)
		total = uint64_t(*facts.duration) * multiplier;
}

inline void
ProgressEstimator::CreateBar(const MediaFacts &facts)
{
	BarOptions options;
	if (facts.source)
		options.label = TrimLabel(*facts.source);
	options.total = total;
	options.unit = unit;
	options.style = &style;

	bar = factory.CreateRenderer(options);

	logger.Fmt(3, "progress in {}, total={}", GetUnitName(unit),
		   total ? fmt::to_string(*total) : "?");
}

void
ProgressEstimator::OnPosition(unsigned elapsed_seconds,
			      const MediaFacts &facts)
{
	if (closed)
		return;

	if (!HasBar()) {
		if (multiplier == 0)
			LockUnit(facts);
		CreateBar(facts);
	} else if (!total && facts.duration) {
		/* the duration was printed after the first
		   position */
		total = uint64_t(*facts.duration) * multiplier;
		bar->SetTotal(*total);
	}

	const uint64_t current = uint64_t(elapsed_seconds) * multiplier;

	if (style.colored && total && *total > 0) {
		const double percentage = double(current) / double(*total) * 100;
		bar->SetBarStyle(style.GetBandStyle(GetColorBand(percentage)));
	}

	if (current > position) {
		bar->Update(current - position);
		position = current;
	}
}

void
ProgressEstimator::Close()
{
	if (closed)
		return;

	closed = true;

	if (bar)
		bar->Close();
}
