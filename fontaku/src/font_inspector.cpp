#include <fmt/format.h>
#include <fontaku/error.hpp>
#include <fontaku/font_inspector.hpp>
#include <impl/ft_library.hpp>
#include <fstream>
#include <iterator>

namespace fontaku {
struct FontInspector::Impl {
	FtLibrary library{};
};

FontInspector::FontInspector() : m_impl(std::make_unique<Impl>()) {
	auto lib = FT_Library{};
	if (auto const error = FT_Init_FreeType(&lib); error != FT_Err_Ok) { throw SerializationError{fmt::format("failed to initialize FreeType (error {})", error)}; }
	m_impl->library = FtLibrary{lib};
}

FontInspector::~FontInspector() = default;
FontInspector::FontInspector(FontInspector&&) noexcept = default;
FontInspector& FontInspector::operator=(FontInspector&&) noexcept = default;

FontReport FontInspector::inspect(std::span<std::byte const> bytes) const {
	auto face = FT_Face{};
	auto const* data = reinterpret_cast<FT_Byte const*>(bytes.data());
	if (auto const error = FT_New_Memory_Face(m_impl->library.get(), data, static_cast<FT_Long>(bytes.size()), 0, &face); error != FT_Err_Ok) {
		throw SerializationError{fmt::format("FreeType failed to load font (error {})", error)};
	}
	auto const owned = FtFace{face};

	auto ret = FontReport{};
	ret.glyph_count = static_cast<std::size_t>(face->num_glyphs);
	if (face->family_name) { ret.family = face->family_name; }
	if (face->style_name) { ret.style = face->style_name; }

	if (FT_HAS_GLYPH_NAMES(face)) {
		char buffer[256]{};
		for (FT_UInt i = 0; i < static_cast<FT_UInt>(face->num_glyphs); ++i) {
			if (FT_Get_Glyph_Name(face, i, buffer, sizeof(buffer)) != FT_Err_Ok) {
				throw SerializationError{fmt::format("FreeType failed to read name of glyph {}", i)};
			}
			ret.glyph_names.emplace_back(buffer);
		}
	}

	if (FT_Select_Charmap(face, FT_ENCODING_UNICODE) == FT_Err_Ok) {
		auto glyph_index = FT_UInt{};
		for (auto code = FT_Get_First_Char(face, &glyph_index); glyph_index != 0; code = FT_Get_Next_Char(face, code, &glyph_index)) {
			ret.mappings.insert_or_assign(Codepoint{static_cast<std::uint32_t>(code)}, static_cast<std::uint32_t>(glyph_index));
		}
	}

	for (FT_Int i = 0; i < face->num_fixed_sizes; ++i) {
		ret.strike_ppems.push_back(static_cast<std::uint16_t>((face->available_sizes[i].y_ppem + 32) >> 6));
	}
	return ret;
}

FontReport FontInspector::inspect_file(std::filesystem::path const& path) const {
	auto file = std::ifstream{path, std::ios::binary};
	if (!file) { throw SerializationError{fmt::format("failed to open font file: {}", path.generic_string())}; }
	auto const buffer = std::vector<char>{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
	return inspect(std::as_bytes(std::span{buffer}));
}
} // namespace fontaku
