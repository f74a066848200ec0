#pragma once
#include <fontaku/image.hpp>
#include <filesystem>
#include <string>

namespace fontaku {
///
/// \brief Handle to a raster file on disk.
///
/// Holds only the path: the file is opened, read and closed inside each call that needs its contents.
///
class SourceImage {
  public:
	explicit SourceImage(std::filesystem::path path) : m_path(std::move(path)) {}

	std::filesystem::path const& path() const { return m_path; }
	std::string filename() const { return m_path.filename().string(); }
	std::string stem() const { return m_path.stem().string(); }

	///
	/// \brief Read the intrinsic pixel dimensions from the file header.
	///
	Extent2D extent() const { return read_image_extent(m_path.string().c_str()); }
	///
	/// \brief Read and decode the whole file.
	///
	Image decode() const { return Image{m_path.string().c_str()}; }

	bool operator==(SourceImage const& rhs) const { return m_path == rhs.m_path; }

  private:
	std::filesystem::path m_path{};
};
} // namespace fontaku
