#pragma once
#include <glm/vec2.hpp>
#include <fontaku/rgba.hpp>
#include <fontaku/util/dyn_array.hpp>
#include <cstddef>
#include <span>

namespace fontaku {
using Index2D = glm::tvec2<std::size_t>;
using Extent2D = glm::uvec2;

constexpr std::size_t to_1d_index(Index2D const index2d, std::size_t columns) { return index2d.y * columns + index2d.x; }

///
/// \brief Non-owning 2D view over a row-major span of Rgba.
///
class PixelMap {
  public:
	struct View;

	constexpr PixelMap(std::span<Rgba> rgba, Extent2D extent) : m_pixels(rgba), m_extent(extent) {}

	constexpr Extent2D extent() const { return m_extent; }
	constexpr bool is_valid(Index2D index) const { return index.x < m_extent.x && index.y < m_extent.y; }

	constexpr std::span<Rgba> span() { return m_pixels; }
	constexpr std::span<Rgba const> span() const { return m_pixels; }

	View view() const;

	Rgba& operator[](Index2D index);
	Rgba const& operator[](Index2D index) const;

	///
	/// \brief Set every pixel to rgba.
	///
	void fill(Rgba rgba);

	///
	/// \brief Composite src over this map with its top-left corner at top_left.
	///
	/// Pixels of src that fall outside this map are clipped.
	///
	void paste(PixelMap const& src, Index2D top_left);

  protected:
	PixelMap() = default;

	constexpr void repoint(std::span<Rgba> pixels, Extent2D extent) {
		m_pixels = pixels;
		m_extent = extent;
	}

	std::span<Rgba> m_pixels{};
	Extent2D m_extent{};
};

///
/// \brief Read-only view of tightly packed RGBA8 bytes.
///
struct PixelMap::View {
	std::span<std::byte const> bytes{};
	Extent2D extent{};
};

///
/// \brief PixelMap that owns its storage.
///
class DynPixelMap : public PixelMap {
  public:
	DynPixelMap() = default;
	explicit DynPixelMap(Extent2D extent, Rgba fill_with = clear_v);

	DynPixelMap(DynPixelMap&& rhs) noexcept : PixelMap(), m_storage(std::move(rhs.m_storage)) { adopt(rhs); }
	DynPixelMap& operator=(DynPixelMap&& rhs) noexcept {
		if (&rhs != this) {
			m_storage = std::move(rhs.m_storage);
			adopt(rhs);
		}
		return *this;
	}

  private:
	void adopt(DynPixelMap& rhs) {
		repoint(m_storage.span(), rhs.m_extent);
		rhs.repoint({}, {});
	}

	DynArray<Rgba> m_storage{};
};
} // namespace fontaku
