#pragma once
#include <glm/vec4.hpp>
#include <cstdint>

namespace fontaku {
///
/// \brief 4-channel 8-bit colour with straight (non-premultiplied) alpha.
///
struct Rgba {
	glm::tvec4<std::uint8_t> channels{0xff, 0xff, 0xff, 0xff};

	constexpr std::uint8_t alpha() const { return channels.w; }

	constexpr bool operator==(Rgba const&) const = default;
};

static_assert(sizeof(Rgba) == 4, "Rgba must be tightly packed RGBA8");

constexpr auto clear_v = Rgba{{0x0, 0x0, 0x0, 0x0}};
constexpr auto white_v = Rgba{{0xff, 0xff, 0xff, 0xff}};
constexpr auto red_v = Rgba{{0xff, 0x0, 0x0, 0xff}};
constexpr auto blue_v = Rgba{{0x0, 0x0, 0xff, 0xff}};

///
/// \brief Composite src over dst (Porter-Duff "source over", straight alpha).
///
constexpr Rgba composite_over(Rgba const src, Rgba const dst) {
	std::uint32_t const sa = src.alpha();
	if (sa == 0xff) { return src; }
	if (sa == 0) { return dst; }
	std::uint32_t const da = dst.alpha();
	auto const inv = 0xffu - sa;
	// out_alpha scaled by 255
	auto const out_a = sa * 0xffu + da * inv;
	auto const blend = [&](std::uint8_t const s, std::uint8_t const d) {
		auto const num = s * sa * 0xffu + d * da * inv;
		return static_cast<std::uint8_t>((num + out_a / 2) / out_a);
	};
	return Rgba{{
		blend(src.channels.x, dst.channels.x),
		blend(src.channels.y, dst.channels.y),
		blend(src.channels.z, dst.channels.z),
		static_cast<std::uint8_t>((out_a + 0x7fu) / 0xffu),
	}};
}
} // namespace fontaku
