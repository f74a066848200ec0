#pragma once
#include <fontaku/allocation_mode.hpp>
#include <fontaku/source_image.hpp>
#include <vector>

namespace fontaku {
///
/// \brief Check if path names a PNG file (extension compared case-insensitively).
///
bool is_png_path(std::filesystem::path const& path);

///
/// \brief Check if a file stem carries a legacy codepoint prefix (U+ or u+).
///
bool has_codepoint_prefix(std::string_view stem);

///
/// \brief Collect source images from a directory.
/// \param directory Directory to scan (not recursive)
/// \param mode eStandard takes every PNG, eLegacy only PNGs whose stem starts with U+
/// \returns Images ordered by filename
///
/// Throws EmptyInputError if directory does not exist, is not a directory, or has no matching files.
///
std::vector<SourceImage> scan_directory(std::filesystem::path const& directory, AllocationMode mode);
} // namespace fontaku
