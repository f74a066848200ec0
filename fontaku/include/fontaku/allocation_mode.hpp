#pragma once
#include <fontaku/util/enum_array.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace fontaku {
///
/// \brief How codepoints are assigned to source images.
///
/// eStandard: sequential from a base codepoint, in filename order.
/// eLegacy: parsed from U+<hex> filenames, in codepoint order.
///
enum class AllocationMode : std::uint8_t { eStandard, eLegacy, eCOUNT_ };

constexpr auto allocation_mode_names_v = EnumArray<AllocationMode, std::string_view>{"standard", "legacy"};

constexpr std::optional<AllocationMode> to_allocation_mode(std::string_view const name) {
	if (name == allocation_mode_names_v[AllocationMode::eStandard]) { return AllocationMode::eStandard; }
	if (name == allocation_mode_names_v[AllocationMode::eLegacy]) { return AllocationMode::eLegacy; }
	return {};
}
} // namespace fontaku
