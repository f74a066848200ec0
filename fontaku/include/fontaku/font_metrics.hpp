#pragma once
#include <cstdint>
#include <string>

namespace fontaku {
///
/// \brief Vertical and horizontal metrics in design units.
///
/// Defaults match Apple Color Emoji: a square em of 800 units with the bitmap bottom on a 250 unit descender.
///
struct FontMetrics {
	std::uint16_t units_per_em{800};
	std::uint16_t advance_width{800};
	std::uint16_t notdef_advance_width{500};
	std::int16_t left_side_bearing{0};

	std::int16_t ascender{800};
	std::int16_t descender{-250};
	std::int16_t line_gap{0};

	std::int16_t typo_ascender{750};
	std::int16_t typo_descender{-250};
	std::int16_t typo_line_gap{0};
	std::uint16_t win_ascent{0};
	std::uint16_t win_descent{0};
	std::int16_t x_height{500};
	std::int16_t cap_height{800};

	///
	/// \brief Depth of the descender below the baseline (positive).
	///
	constexpr std::int32_t descender_depth() const { return -static_cast<std::int32_t>(descender); }
};

///
/// \brief Naming strings written to the name table.
///
struct FontNames {
	std::string family{"Fontaku"};
	std::string style{"Regular"};
	std::string version{"Version 1.0"};

	std::string full_name() const { return family + " " + style; }
	///
	/// \brief PostScript name: family-style with spaces removed.
	///
	std::string postscript_name() const;
	std::string unique_id() const { return postscript_name(); }
};
} // namespace fontaku
