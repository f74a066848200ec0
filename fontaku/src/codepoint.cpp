#include <fmt/format.h>
#include <fontaku/codepoint.hpp>
#include <charconv>

namespace fontaku {
std::string make_glyph_name(Codepoint const cp) { return fmt::format("uni{:04X}", to_u32(cp)); }

std::string to_string(Codepoint const cp) { return fmt::format("U+{:04X}", to_u32(cp)); }

std::optional<Codepoint> parse_hex(std::string_view const text) {
	if (text.empty()) { return {}; }
	auto value = std::uint32_t{};
	auto const* end = text.data() + text.size();
	auto const [ptr, ec] = std::from_chars(text.data(), end, value, 16);
	if (ec != std::errc{} || ptr != end) { return {}; }
	return Codepoint{value};
}
} // namespace fontaku
