#include <fontaku/error.hpp>
#include <fontaku/font_assembler.hpp>
#include <fontaku/strike_builder.hpp>
#include <fontaku/util/thread_pool.hpp>
#include <future>

namespace fontaku {
namespace {
void notify_stage(Ptr<BuildObserver> observer, std::string_view const stage) {
	if (observer) { observer->on_stage(stage); }
}

std::vector<std::string> make_glyph_order(Allocation const& allocation) {
	auto ret = std::vector<std::string>{};
	ret.reserve(allocation.glyph_count());
	for (auto& identity : allocation.glyph_order()) { ret.push_back(std::move(identity.name)); }
	return ret;
}

CharacterMap make_character_map(Allocation const& allocation) {
	auto ret = CharacterMap{};
	for (auto const& glyph : allocation.glyphs) { ret.insert_or_assign(glyph.identity.codepoint, glyph.identity.name); }
	return ret;
}

std::vector<HorizontalMetric> make_horizontal_metrics(FontMetrics const& metrics, std::size_t const glyph_count) {
	auto ret = std::vector<HorizontalMetric>(glyph_count, HorizontalMetric{metrics.advance_width, metrics.left_side_bearing});
	ret.front().advance_width = metrics.notdef_advance_width;
	return ret;
}

HeadTable make_head(FontMetrics const& metrics, Clock const& clock) {
	auto const now = to_unix_seconds(clock.now());
	return HeadTable{.units_per_em = metrics.units_per_em, .created = now, .modified = now};
}

OS2Table make_os2(FontMetrics const& metrics) {
	auto ret = OS2Table{};
	ret.typo_ascender = metrics.typo_ascender;
	ret.typo_descender = metrics.typo_descender;
	ret.typo_line_gap = metrics.typo_line_gap;
	ret.win_ascent = metrics.win_ascent;
	ret.win_descent = metrics.win_descent;
	ret.x_height = metrics.x_height;
	ret.cap_height = metrics.cap_height;
	return ret;
}
} // namespace

FontDocument FontAssembler::assemble(Allocation const& allocation, std::span<StrikeSpec const> strike_specs) const {
	if (allocation.glyphs.empty()) { throw EmptyInputError{"no glyphs to assemble"}; }
	if (strike_specs.empty()) { throw InvalidSizeError{"no strikes to assemble"}; }

	auto const system_clock = Clock::System{};
	auto const& clock = m_info.clock ? *m_info.clock : static_cast<Clock const&>(system_clock);
	auto const& metrics = m_info.metrics;

	notify_stage(m_info.observer, "tables");
	auto builder = FontDocument::Builder{}
					   .set_glyph_order(make_glyph_order(allocation))
					   .set_character_map(make_character_map(allocation))
					   .set_outlines(std::vector<GlyphOutline>(allocation.glyph_count()))
					   .set_horizontal_metrics(make_horizontal_metrics(metrics, allocation.glyph_count()))
					   .set_head(make_head(metrics, clock))
					   .set_horizontal_header(HorizontalHeader{metrics.ascender, metrics.descender, metrics.line_gap})
					   .set_os2(make_os2(metrics))
					   .set_names(m_info.names)
					   .set_post(PostTable{});

	notify_stage(m_info.observer, "strikes");
	auto bitmap_table = build_strikes(allocation, strike_specs);

	notify_stage(m_info.observer, "document");
	return std::move(builder).set_bitmap_table(std::move(bitmap_table));
}

BitmapTable FontAssembler::build_strikes(Allocation const& allocation, std::span<StrikeSpec const> strike_specs) const {
	auto const strike_builder = StrikeBuilder{{.metrics = m_info.metrics, .observer = m_info.observer}};
	auto ret = BitmapTable{};
	ret.strikes.reserve(strike_specs.size());

	if (!m_info.thread_pool || strike_specs.size() < 2) {
		for (auto const& spec : strike_specs) { ret.strikes.push_back(strike_builder.build(allocation, spec)); }
		return ret;
	}

	auto futures = std::vector<std::future<Strike>>{};
	futures.reserve(strike_specs.size());
	for (auto const& spec : strike_specs) {
		futures.push_back(m_info.thread_pool->submit([&strike_builder, &allocation, spec] { return strike_builder.build(allocation, spec); }));
	}
	// wait for every strike before rethrowing so no task outlives strike_builder
	for (auto& future : futures) { future.wait(); }
	for (auto& future : futures) { ret.strikes.push_back(future.get()); }
	return ret;
}
} // namespace fontaku
