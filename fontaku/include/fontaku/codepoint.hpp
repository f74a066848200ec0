#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fontaku {
enum struct Codepoint : std::uint32_t {
	eNull = 0u,
	eSurrogateFirst = 0xd800u,
	eSurrogateLast = 0xdfffu,
	eDefaultBase = 0x1f600u,
	eMax = 0x10ffffu,
};

constexpr std::uint32_t to_u32(Codepoint const cp) { return static_cast<std::uint32_t>(cp); }

constexpr bool is_surrogate(Codepoint const cp) { return cp >= Codepoint::eSurrogateFirst && cp <= Codepoint::eSurrogateLast; }

///
/// \brief Check if cp is a Unicode scalar value (in range, not a surrogate).
///
constexpr bool is_scalar_value(Codepoint const cp) { return cp <= Codepoint::eMax && !is_surrogate(cp); }

///
/// \brief Check if cp can be mapped to a glyph.
///
/// Excludes the null codepoint and the BMP noncharacters U+FFFE / U+FFFF (the latter terminates cmap format 4).
///
constexpr bool is_mappable(Codepoint const cp) {
	if (!is_scalar_value(cp) || cp == Codepoint::eNull) { return false; }
	return to_u32(cp) != 0xfffeu && to_u32(cp) != 0xffffu;
}

///
/// \brief Name and codepoint of one glyph.
///
/// The reserved .notdef identity carries Codepoint::eNull and is never mapped.
///
struct GlyphIdentity {
	static constexpr std::string_view notdef_name_v{".notdef"};

	std::string name{};
	Codepoint codepoint{};

	static GlyphIdentity notdef() { return GlyphIdentity{.name = std::string{notdef_name_v}}; }

	bool is_notdef() const { return codepoint == Codepoint::eNull; }

	bool operator==(GlyphIdentity const&) const = default;
};

///
/// \brief Build the glyph name for a codepoint ("uni" followed by at least 4 uppercase hex digits).
///
std::string make_glyph_name(Codepoint cp);

///
/// \brief Format a codepoint as U+XXXX.
///
std::string to_string(Codepoint cp);

///
/// \brief Parse a bare hexadecimal codepoint (no prefix, case-insensitive).
/// \returns std::nullopt if text is empty, has non-hex characters, or overflows 32 bits
///
std::optional<Codepoint> parse_hex(std::string_view text);
} // namespace fontaku
