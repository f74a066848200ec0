#include <fmt/format.h>
#include <fontaku/error.hpp>
#include <fontaku/font_document.hpp>
#include <algorithm>
#include <limits>
#include <unordered_set>

namespace fontaku {
namespace {
constexpr std::size_t max_glyphs_v{std::numeric_limits<std::uint16_t>::max()};

template <typename Type>
void ensure_per_glyph(std::vector<Type> const& values, std::size_t const glyph_count, std::string_view what) {
	if (values.size() != glyph_count) { throw SerializationError{fmt::format("{} count ({}) does not match glyph count ({})", what, values.size(), glyph_count)}; }
}

bool fits_i16(int const value) { return value >= std::numeric_limits<std::int16_t>::min() && value <= std::numeric_limits<std::int16_t>::max(); }

void validate_strike(Strike const& strike, std::vector<std::string> const& glyph_order) {
	auto const glyphs = strike.glyphs();
	auto const ppem = strike.spec().ppem;
	if (ppem == 0) { throw SerializationError{"strike has zero ppem"}; }
	if (glyphs.size() != glyph_order.size()) {
		throw SerializationError{fmt::format("strike {} has {} glyphs, expected {}", ppem, glyphs.size(), glyph_order.size())};
	}
	for (std::size_t i = 0; i < glyphs.size(); ++i) {
		auto const& glyph = glyphs[i];
		if (glyph.glyph_name != glyph_order[i]) {
			throw SerializationError{fmt::format("strike {} glyph {} is '{}', expected '{}'", ppem, i, glyph.glyph_name, glyph_order[i])};
		}
		if (!fits_i16(glyph.origin.x) || !fits_i16(glyph.origin.y)) {
			throw SerializationError{fmt::format("strike {} glyph '{}' origin offset out of range: ({}, {})", ppem, glyph.glyph_name, glyph.origin.x, glyph.origin.y)};
		}
	}
}
} // namespace

std::optional<std::uint16_t> FontDocument::glyph_id(std::string_view const glyph_name) const {
	auto const it = std::find(m_tables.glyph_order.begin(), m_tables.glyph_order.end(), glyph_name);
	if (it == m_tables.glyph_order.end()) { return {}; }
	return static_cast<std::uint16_t>(it - m_tables.glyph_order.begin());
}

auto FontDocument::Builder::set_glyph_order(std::vector<std::string> glyph_order) && -> CharacterMapStage {
	if (glyph_order.empty() || glyph_order.front() != GlyphIdentity::notdef_name_v) { throw SerializationError{"glyph order must start with .notdef"}; }
	if (glyph_order.size() > max_glyphs_v) { throw SerializationError{fmt::format("too many glyphs: {} (max {})", glyph_order.size(), max_glyphs_v)}; }
	auto names = std::unordered_set<std::string_view>{};
	for (auto const& name : glyph_order) {
		if (name.empty()) { throw SerializationError{"empty glyph name"}; }
		if (!names.insert(name).second) { throw SerializationError{fmt::format("duplicate glyph name: {}", name)}; }
	}
	m_tables.glyph_order = std::move(glyph_order);
	return advance<CharacterMapStage>(std::move(m_tables));
}

auto FontDocument::Builder::CharacterMapStage::set_character_map(CharacterMap character_map) && -> OutlineStage {
	auto const& order = m_tables.glyph_order;
	for (auto const& [codepoint, name] : character_map) {
		if (!is_mappable(codepoint)) { throw SerializationError{fmt::format("cannot map {}", to_string(codepoint))}; }
		if (name == GlyphIdentity::notdef_name_v) { throw SerializationError{fmt::format("{} maps to .notdef", to_string(codepoint))}; }
		if (std::ranges::find(order, name) == order.end()) { throw SerializationError{fmt::format("{} maps to unknown glyph: {}", to_string(codepoint), name)}; }
	}
	m_tables.character_map = std::move(character_map);
	return Builder::advance<OutlineStage>(std::move(m_tables));
}

auto FontDocument::Builder::OutlineStage::set_outlines(std::vector<GlyphOutline> outlines) && -> MetricsStage {
	ensure_per_glyph(outlines, m_tables.glyph_order.size(), "outline");
	if (std::ranges::any_of(outlines, [](GlyphOutline const& o) { return o.contour_count > 0; })) {
		throw SerializationError{"only empty outlines are supported"};
	}
	m_tables.outlines = std::move(outlines);
	return Builder::advance<MetricsStage>(std::move(m_tables));
}

auto FontDocument::Builder::MetricsStage::set_horizontal_metrics(std::vector<HorizontalMetric> metrics) && -> HeadStage {
	ensure_per_glyph(metrics, m_tables.glyph_order.size(), "horizontal metric");
	m_tables.horizontal_metrics = std::move(metrics);
	return Builder::advance<HeadStage>(std::move(m_tables));
}

auto FontDocument::Builder::HeadStage::set_head(HeadTable head) && -> HorizontalHeaderStage {
	// valid range for TrueType
	if (head.units_per_em < 16 || head.units_per_em > 16384) { throw SerializationError{fmt::format("invalid unitsPerEm: {}", head.units_per_em)}; }
	m_tables.head = head;
	return Builder::advance<HorizontalHeaderStage>(std::move(m_tables));
}

auto FontDocument::Builder::HorizontalHeaderStage::set_horizontal_header(HorizontalHeader horizontal_header) && -> OS2Stage {
	m_tables.horizontal_header = horizontal_header;
	return Builder::advance<OS2Stage>(std::move(m_tables));
}

auto FontDocument::Builder::OS2Stage::set_os2(OS2Table os2) && -> NameStage {
	m_tables.os2 = os2;
	return Builder::advance<NameStage>(std::move(m_tables));
}

auto FontDocument::Builder::NameStage::set_names(FontNames names) && -> PostStage {
	if (names.family.empty() || names.style.empty()) { throw SerializationError{"font family and style names must not be empty"}; }
	m_tables.names = std::move(names);
	return Builder::advance<PostStage>(std::move(m_tables));
}

auto FontDocument::Builder::PostStage::set_post(PostTable post) && -> BitmapStage {
	m_tables.post = post;
	return Builder::advance<BitmapStage>(std::move(m_tables));
}

FontDocument FontDocument::Builder::BitmapStage::set_bitmap_table(BitmapTable bitmap_table) && {
	if (bitmap_table.strikes.empty()) { throw SerializationError{"bitmap table has no strikes"}; }
	for (std::size_t i = 0; i < bitmap_table.strikes.size(); ++i) {
		auto const& strike = bitmap_table.strikes[i];
		validate_strike(strike, m_tables.glyph_order);
		if (i > 0 && strike.spec().ppem <= bitmap_table.strikes[i - 1].spec().ppem) {
			throw SerializationError{fmt::format("strikes out of order: {} after {}", strike.spec().ppem, bitmap_table.strikes[i - 1].spec().ppem)};
		}
	}
	m_tables.bitmap_table = std::move(bitmap_table);
	return Builder::finish(std::move(m_tables));
}
} // namespace fontaku
