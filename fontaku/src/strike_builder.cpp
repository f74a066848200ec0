#include <fontaku/image_transformer.hpp>
#include <fontaku/strike_builder.hpp>
#include <cmath>

namespace fontaku {
OriginOffset compute_origin_offset(FontMetrics const& metrics, std::uint16_t const ppem) {
	auto const units_per_pixel = static_cast<double>(metrics.units_per_em) / static_cast<double>(ppem);
	// truncates toward zero: ppem 40 yields -12, not -13
	auto const y = std::trunc(-static_cast<double>(metrics.descender_depth()) / units_per_pixel);
	return OriginOffset{0, static_cast<int>(y)};
}

Strike StrikeBuilder::build(Allocation const& allocation, StrikeSpec const& spec) const {
	if (m_info.observer) { m_info.observer->on_strike_begin(spec, allocation.glyph_count()); }

	auto const origin = compute_origin_offset(m_info.metrics, spec.ppem);
	auto glyphs = std::vector<StrikeGlyph>{};
	glyphs.reserve(allocation.glyph_count());
	glyphs.push_back(StrikeGlyph{.glyph_name = std::string{GlyphIdentity::notdef_name_v}});
	for (auto const& glyph : allocation.glyphs) {
		auto bitmap = transform(glyph.source, spec.ppem);
		if (m_info.observer) { m_info.observer->on_glyph(spec, glyph.identity, bitmap); }
		glyphs.push_back(StrikeGlyph{.glyph_name = glyph.identity.name, .origin = origin, .data = std::move(bitmap.png)});
	}

	auto ret = Strike{spec, std::move(glyphs)};
	if (m_info.observer) { m_info.observer->on_strike_end(ret); }
	return ret;
}
} // namespace fontaku
