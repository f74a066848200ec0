#pragma once
#include <fontaku/image.hpp>
#include <fontaku/source_image.hpp>
#include <cstdint>
#include <vector>

namespace fontaku {
///
/// \brief Where a scaled source lands inside a square canvas.
///
struct Placement {
	///
	/// \brief Scaled size of the source (longer edge equals the canvas edge).
	///
	Extent2D size{};
	///
	/// \brief Top-left corner of the source within the canvas.
	///
	Index2D offset{};
};

///
/// \brief Fit source into a target x target square, preserving aspect ratio.
/// \param source Intrinsic extent of the source (both edges non-zero)
/// \param target Edge length of the square canvas (> 0)
///
/// The shorter edge is rounded to the nearest pixel (at least 1); leftover space is split with the odd pixel on the right / bottom.
/// Throws InvalidSizeError if target <= 0, UnreadableImageError if source has a zero edge.
///
Placement fit_to_square(Extent2D source, std::int64_t target);

///
/// \brief Square RGBA raster of one glyph at one strike size, with its PNG encoding.
///
struct RenderedBitmap {
	Placement placement{};
	DynPixelMap canvas{};
	std::vector<std::byte> png{};

	std::uint32_t size() const { return canvas.extent().x; }
};

///
/// \brief Resample image into a transparent target x target canvas, centered.
///
/// Deterministic: identical pixels and target always produce identical PNG bytes.
///
RenderedBitmap transform(Image const& image, std::int64_t target);

///
/// \brief Read, decode and transform a source file.
///
/// Throws UnreadableImageError if the file is missing or undecodable, InvalidSizeError if target <= 0.
///
RenderedBitmap transform(SourceImage const& source, std::int64_t target);
} // namespace fontaku
