#include <fmt/format.h>
#include <fontaku/error.hpp>
#include <fontaku/strike.hpp>
#include <algorithm>
#include <limits>

namespace fontaku {
std::vector<StrikeSpec> make_strike_specs(std::span<std::int64_t const> ppems, std::int64_t const resolution) {
	constexpr std::int64_t max_v{std::numeric_limits<std::uint16_t>::max()};
	if (ppems.empty()) { throw InvalidSizeError{"no strike sizes specified"}; }
	if (resolution <= 0 || resolution > max_v) { throw InvalidSizeError{fmt::format("invalid strike resolution: {}", resolution)}; }

	auto sorted = std::vector<std::int64_t>{ppems.begin(), ppems.end()};
	std::ranges::sort(sorted);
	for (std::size_t i = 0; i < sorted.size(); ++i) {
		if (sorted[i] <= 0 || sorted[i] > max_v) { throw InvalidSizeError{fmt::format("invalid strike size: {}", sorted[i])}; }
		if (i > 0 && sorted[i] == sorted[i - 1]) { throw InvalidSizeError{fmt::format("duplicate strike size: {}", sorted[i])}; }
	}

	auto ret = std::vector<StrikeSpec>{};
	ret.reserve(sorted.size());
	for (auto const ppem : sorted) {
		ret.push_back(StrikeSpec{.ppem = static_cast<std::uint16_t>(ppem), .resolution = static_cast<std::uint16_t>(resolution)});
	}
	return ret;
}

Ptr<StrikeGlyph const> Strike::find(std::string_view const glyph_name) const {
	auto const it = std::ranges::find_if(m_glyphs, [glyph_name](StrikeGlyph const& glyph) { return glyph.glyph_name == glyph_name; });
	if (it == m_glyphs.end()) { return {}; }
	return &*it;
}
} // namespace fontaku
