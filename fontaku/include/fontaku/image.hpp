#pragma once
#include <fontaku/pixel_map.hpp>
#include <fontaku/util/unique.hpp>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace fontaku {
///
/// \brief Storage for uncompressed RGBA image data (as bytes).
///
/// Every constructor either produces a valid image or throws UnreadableImageError.
///
class Image {
  public:
	///
	/// \brief View into an image.
	///
	/// Must not outlive the image.
	///
	using View = PixelMap::View;

	Image() = default;

	///
	/// \brief Construct an instance and decompress image data (PNG, etc).
	/// \param compressed Image data (compressed)
	/// \param name Name of the image (used in diagnostics)
	///
	/// Sources without an alpha channel are expanded to fully opaque RGBA.
	///
	explicit Image(std::span<std::byte const> compressed, std::string name = {});

	///
	/// \brief Read and decompress an image file.
	/// \param file_path Path to image
	///
	/// The file is opened, read fully, and closed before decoding.
	///
	explicit Image(char const* file_path);

	View view() const;
	std::string_view name() const { return m_name; }
	Extent2D extent() const { return m_extent; }

	operator View() const { return view(); }

	///
	/// \brief Check if any image data is stored in this instance.
	/// \returns true If extent is non-zero and image data is present
	///
	explicit operator bool() const;

  private:
	struct Storage {
		std::size_t size{};
		std::byte const* data{};

		std::span<std::byte const> bytes() const { return {data, size}; }

		struct Deleter {
			void operator()(Storage const& storage) const;
		};
	};

	std::string m_name{};
	Unique<Storage, Storage::Deleter> m_storage{};
	Extent2D m_extent{};
};

///
/// \brief Read the pixel dimensions of an image file without decoding it.
/// \param file_path Path to image
/// \returns Width and height in pixels
///
/// Throws UnreadableImageError if the header cannot be parsed.
///
Extent2D read_image_extent(char const* file_path);

///
/// \brief Resample an image to a new extent (Catmull-Rom, sRGB aware, alpha weighted).
/// \param source Image to resample
/// \param target Desired extent (both edges must be non-zero)
/// \returns Resampled pixels
///
DynPixelMap resize(PixelMap::View source, Extent2D target);

///
/// \brief Encode pixels as a PNG (8-bit RGBA).
/// \param pixels Pixels to encode
/// \returns PNG file bytes
///
std::vector<std::byte> encode_png(PixelMap const& pixels);
} // namespace fontaku
