#pragma once
#include <fontaku/codepoint.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace fontaku {
///
/// \brief What a font rasterizer sees in a font file.
///
struct FontReport {
	std::size_t glyph_count{};
	std::string family{};
	std::string style{};
	///
	/// \brief Glyph names in glyph order (empty if the font carries none).
	///
	std::vector<std::string> glyph_names{};
	///
	/// \brief Unicode charmap: codepoint to glyph index.
	///
	std::map<Codepoint, std::uint32_t> mappings{};
	///
	/// \brief Pixels-per-em of every bitmap strike, in the order the font lists them.
	///
	std::vector<std::uint16_t> strike_ppems{};
};

///
/// \brief Loads font files through FreeType to verify what was written.
///
class FontInspector {
  public:
	///
	/// \brief Throws SerializationError if FreeType fails to initialize.
	///
	FontInspector();
	~FontInspector();

	FontInspector(FontInspector&&) noexcept;
	FontInspector& operator=(FontInspector&&) noexcept;

	///
	/// \brief Parse font bytes.
	///
	/// Throws SerializationError if FreeType rejects the data.
	///
	FontReport inspect(std::span<std::byte const> bytes) const;
	///
	/// \brief Read and parse a font file.
	///
	FontReport inspect_file(std::filesystem::path const& path) const;

  private:
	struct Impl;
	std::unique_ptr<Impl> m_impl;
};
} // namespace fontaku
