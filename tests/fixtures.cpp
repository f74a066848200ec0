#include <stb/stb_image_write.h>
#include <fixtures.hpp>
#include <stdexcept>
#include <cstdint>
#include <string>
#include <vector>

namespace fixture {
namespace fs = std::filesystem;

ScratchDir::ScratchDir(std::string_view name) : m_path(fs::temp_directory_path() / "fontaku-tests" / name) {
	fs::remove_all(m_path);
	fs::create_directories(m_path);
}

ScratchDir::~ScratchDir() {
	auto ec = std::error_code{};
	fs::remove_all(m_path, ec);
}

namespace {
void write(fs::path const& path, fontaku::PixelMap const& pixels) {
	auto const extent = pixels.extent();
	auto const path_str = path.string();
	auto const* data = pixels.span().data();
	auto const stride = static_cast<int>(extent.x * sizeof(Rgba));
	if (!stbi_write_png(path_str.c_str(), static_cast<int>(extent.x), static_cast<int>(extent.y), 4, data, stride)) {
		throw std::runtime_error{"failed to write fixture: " + path_str};
	}
}
} // namespace

std::vector<std::string> make_glyph_order(std::size_t const glyph_count) {
	auto ret = std::vector<std::string>{".notdef"};
	for (std::size_t i = 1; i < glyph_count; ++i) { ret.push_back(fontaku::make_glyph_name(fontaku::Codepoint{static_cast<std::uint32_t>(0x1f600 + i - 1)})); }
	return ret;
}

fontaku::Strike make_strike(std::vector<std::string> const& glyph_order, std::uint16_t const ppem) {
	auto glyphs = std::vector<fontaku::StrikeGlyph>{};
	for (auto const& name : glyph_order) {
		auto& glyph = glyphs.emplace_back(fontaku::StrikeGlyph{.glyph_name = name});
		if (name == ".notdef") { continue; }
		glyph.origin = {0, -static_cast<int>(ppem) * 250 / 800};
		glyph.data = std::vector<std::byte>(ppem % 7 + 3, std::byte{0xab});
	}
	return fontaku::Strike{fontaku::StrikeSpec{.ppem = ppem}, std::move(glyphs)};
}

fontaku::FontDocument make_document(std::size_t const glyph_count, std::vector<std::uint16_t> const& ppems) {
	auto glyph_order = make_glyph_order(glyph_count);
	auto character_map = fontaku::CharacterMap{};
	for (std::size_t i = 1; i < glyph_count; ++i) { character_map.emplace(fontaku::Codepoint{static_cast<std::uint32_t>(0x1f600 + i - 1)}, glyph_order[i]); }
	auto bitmap_table = fontaku::BitmapTable{};
	for (auto const ppem : ppems) { bitmap_table.strikes.push_back(make_strike(glyph_order, ppem)); }
	auto metrics = std::vector<fontaku::HorizontalMetric>(glyph_count, fontaku::HorizontalMetric{800, 0});
	metrics.front().advance_width = 500;

	return fontaku::FontDocument::Builder{}
		.set_glyph_order(std::move(glyph_order))
		.set_character_map(std::move(character_map))
		.set_outlines(std::vector<fontaku::GlyphOutline>(glyph_count))
		.set_horizontal_metrics(std::move(metrics))
		.set_head(fontaku::HeadTable{.created = 1700000000, .modified = 1700000000})
		.set_horizontal_header(fontaku::HorizontalHeader{})
		.set_os2(fontaku::OS2Table{})
		.set_names(fontaku::FontNames{})
		.set_post(fontaku::PostTable{})
		.set_bitmap_table(std::move(bitmap_table));
}

void write_png(fs::path const& path, Extent2D const extent, Rgba const fill) { write(path, fontaku::DynPixelMap{extent, fill}); }

void write_rgb_png(fs::path const& path, Extent2D const extent, Rgba const fill) {
	auto rgb = std::vector<std::uint8_t>{};
	rgb.reserve(std::size_t{extent.x} * extent.y * 3);
	for (std::uint32_t i = 0; i < extent.x * extent.y; ++i) { rgb.insert(rgb.end(), {fill.channels.x, fill.channels.y, fill.channels.z}); }
	auto const path_str = path.string();
	if (!stbi_write_png(path_str.c_str(), static_cast<int>(extent.x), static_cast<int>(extent.y), 3, rgb.data(), static_cast<int>(extent.x * 3))) {
		throw std::runtime_error{"failed to write fixture: " + path_str};
	}
}

void write_half_png(fs::path const& path, Extent2D const extent, Rgba const fill) {
	auto pixels = fontaku::DynPixelMap{extent, fontaku::clear_v};
	for (std::uint32_t y = 0; y < extent.y; ++y) {
		for (std::uint32_t x = 0; x < extent.x / 2; ++x) { pixels[{x, y}] = fill; }
	}
	write(path, pixels);
}
} // namespace fixture
