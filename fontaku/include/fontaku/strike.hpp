#pragma once
#include <glm/vec2.hpp>
#include <fontaku/codepoint.hpp>
#include <fontaku/util/ptr.hpp>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace fontaku {
///
/// \brief Size of one bitmap strike.
///
struct StrikeSpec {
	static constexpr std::uint16_t default_resolution_v{72};

	///
	/// \brief Pixels per em.
	///
	std::uint16_t ppem{};
	///
	/// \brief Pixels per inch.
	///
	std::uint16_t resolution{default_resolution_v};

	auto operator<=>(StrikeSpec const&) const = default;
};

inline constexpr std::array<std::int64_t, 4> default_strike_sizes_v{32, 64, 128, 256};

///
/// \brief Validate and sort strike sizes.
/// \param ppems Requested pixels-per-em (any order)
/// \param resolution Pixels per inch for every strike
/// \returns Specs in strictly increasing ppem order
///
/// Throws InvalidSizeError if ppems is empty or any size is non-positive, above 65535, or duplicated.
///
std::vector<StrikeSpec> make_strike_specs(std::span<std::int64_t const> ppems, std::int64_t resolution = StrikeSpec::default_resolution_v);

///
/// \brief Position of a bitmap relative to the glyph origin, in pixels.
///
using OriginOffset = glm::ivec2;

///
/// \brief Four character sbix graphic type tag.
///
using GraphicType = std::array<char, 4>;

inline constexpr GraphicType png_graphic_type_v{'p', 'n', 'g', ' '};

///
/// \brief Bitmap data for one glyph in one strike.
///
struct StrikeGlyph {
	std::string glyph_name{};
	GraphicType graphic_type{png_graphic_type_v};
	OriginOffset origin{};
	std::vector<std::byte> data{};
};

///
/// \brief All bitmaps of one size, one entry per glyph in glyph order.
///
class Strike {
  public:
	Strike() = default;
	Strike(StrikeSpec spec, std::vector<StrikeGlyph> glyphs) : m_spec(spec), m_glyphs(std::move(glyphs)) {}

	StrikeSpec const& spec() const { return m_spec; }
	std::span<StrikeGlyph const> glyphs() const { return m_glyphs; }

	///
	/// \brief Find the entry for a glyph name.
	/// \returns nullptr if not present
	///
	Ptr<StrikeGlyph const> find(std::string_view glyph_name) const;

  private:
	StrikeSpec m_spec{};
	std::vector<StrikeGlyph> m_glyphs{};
};

///
/// \brief Contents of the sbix table.
///
struct BitmapTable {
	std::uint16_t version{1};
	///
	/// \brief Bit 0 must be set; bit 1 requests drawing outlines in addition to bitmaps.
	///
	std::uint16_t flags{1};
	///
	/// \brief Strikes in increasing ppem order.
	///
	std::vector<Strike> strikes{};
};
} // namespace fontaku
