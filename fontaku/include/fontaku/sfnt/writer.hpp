#pragma once
#include <fontaku/font_document.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace fontaku::sfnt {
///
/// \brief Seconds between 1904-01-01T00:00:00Z (LONGDATETIME epoch) and the Unix epoch.
///
inline constexpr std::int64_t mac_epoch_offset_v{2082844800};

///
/// \brief Value that the whole-font checksum must add up to (after head.checkSumAdjustment).
///
inline constexpr std::uint32_t checksum_magic_v{0xb1b0afba};

///
/// \brief Sum of big-endian uint32 words, zero-padding the tail.
///
std::uint32_t checksum(std::span<std::byte const> bytes);

///
/// \brief Serialize a document into a TrueType font.
///
/// Tables: OS/2 cmap glyf head hhea hmtx loca maxp name post sbix.
/// Throws SerializationError if a table exceeds the limits of its format.
///
std::vector<std::byte> serialize(FontDocument const& document);

///
/// \brief Serialize a document and write it to path.
///
/// Writes to a sibling <path>.tmp and renames it over path only once complete; on failure the temporary file is
/// removed and SerializationError is thrown.
///
void save(FontDocument const& document, std::filesystem::path const& path);

///
/// \brief Write pre-serialized font bytes to path (same guarantees as save()).
///
void save(std::span<std::byte const> bytes, std::filesystem::path const& path);
} // namespace fontaku::sfnt
