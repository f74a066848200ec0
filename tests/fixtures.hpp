#pragma once
#include <fontaku/font_document.hpp>
#include <fontaku/pixel_map.hpp>
#include <fontaku/util/pinned.hpp>
#include <filesystem>
#include <string_view>
#include <vector>

namespace fixture {
using fontaku::Extent2D;
using fontaku::Rgba;

///
/// \brief Empty directory under the system temp path, removed on destruction.
///
class ScratchDir : public fontaku::Pinned {
  public:
	explicit ScratchDir(std::string_view name);
	~ScratchDir();

	std::filesystem::path const& path() const { return m_path; }
	std::filesystem::path operator/(std::string_view filename) const { return m_path / filename; }

  private:
	std::filesystem::path m_path{};
};

///
/// \brief Write a solid colour PNG.
///
void write_png(std::filesystem::path const& path, Extent2D extent, Rgba fill = fontaku::red_v);

///
/// \brief Write a solid colour 3-channel PNG (no alpha channel); the alpha of fill is ignored.
///
void write_rgb_png(std::filesystem::path const& path, Extent2D extent, Rgba fill = fontaku::red_v);

///
/// \brief Write a PNG whose left half is fill and right half is transparent.
///
void write_half_png(std::filesystem::path const& path, Extent2D extent, Rgba fill = fontaku::blue_v);

///
/// \brief Glyph order .notdef, uni1F600, uni1F601... with glyph_count entries in total.
///
std::vector<std::string> make_glyph_order(std::size_t glyph_count);

///
/// \brief Strike with placeholder payloads for every glyph in glyph_order.
///
fontaku::Strike make_strike(std::vector<std::string> const& glyph_order, std::uint16_t ppem);

///
/// \brief Complete document with sequential codepoints from U+1F600 and one strike per ppem.
///
fontaku::FontDocument make_document(std::size_t glyph_count, std::vector<std::uint16_t> const& ppems);

///
/// \brief Check that calling func throws exactly Type (or a type derived from it).
///
template <typename Type, typename F>
bool throws(F func) {
	try {
		func();
	} catch (Type const&) { return true; }
	return false;
}
} // namespace fixture
