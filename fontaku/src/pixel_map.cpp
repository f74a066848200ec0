#include <fontaku/pixel_map.hpp>
#include <algorithm>
#include <cassert>
#include <utility>

namespace fontaku {
Rgba& PixelMap::operator[](Index2D index) { return const_cast<Rgba&>(std::as_const(*this)[index]); }

Rgba const& PixelMap::operator[](Index2D index) const {
	assert(is_valid(index));
	return m_pixels[to_1d_index(index, m_extent.x)];
}

PixelMap::View PixelMap::view() const {
	return View{.bytes = {reinterpret_cast<std::byte const*>(m_pixels.data()), m_pixels.size_bytes()}, .extent = m_extent};
}

void PixelMap::fill(Rgba const rgba) { std::fill(m_pixels.begin(), m_pixels.end(), rgba); }

void PixelMap::paste(PixelMap const& src, Index2D const top_left) {
	auto const src_extent = Index2D{src.extent()};
	for (std::size_t y = 0; y < src_extent.y; ++y) {
		for (std::size_t x = 0; x < src_extent.x; ++x) {
			auto const dst_index = top_left + Index2D{x, y};
			if (!is_valid(dst_index)) { continue; }
			auto& dst = (*this)[dst_index];
			dst = composite_over(src[{x, y}], dst);
		}
	}
}

DynPixelMap::DynPixelMap(Extent2D const extent, Rgba const fill_with) : m_storage(static_cast<std::size_t>(extent.x) * extent.y) {
	repoint(m_storage.span(), extent);
	fill(fill_with);
}
} // namespace fontaku
