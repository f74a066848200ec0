#pragma once
#include <fontaku/allocation_mode.hpp>
#include <fontaku/codepoint.hpp>
#include <fontaku/font_metrics.hpp>
#include <fontaku/strike.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace dj {
class Json;
}

namespace fontaku {
///
/// \brief Everything needed to generate one font.
///
struct BuildConfig {
	std::filesystem::path input{"images"};
	std::filesystem::path output{"Fontaku.ttf"};
	AllocationMode mode{AllocationMode::eStandard};
	///
	/// \brief First codepoint in standard mode.
	///
	Codepoint base{Codepoint::eDefaultBase};
	std::vector<std::int64_t> strikes{default_strike_sizes_v.begin(), default_strike_sizes_v.end()};
	std::int64_t resolution{StrikeSpec::default_resolution_v};
	FontNames names{};
	///
	/// \brief Seconds since the Unix epoch for head.created / head.modified (system clock if unset).
	///
	std::optional<std::int64_t> timestamp{};
	///
	/// \brief Number of strikes built concurrently.
	///
	std::uint32_t jobs{1};
	///
	/// \brief Reload the written font through FreeType and compare it against the document.
	///
	bool verify{};

	///
	/// \brief Overlay the keys present in json onto this config.
	///
	/// Throws ConfigError on a value of the wrong type or out of range.
	///
	void apply(dj::Json const& json);

	///
	/// \brief Load a JSON config file on top of defaults.
	///
	/// Throws ConfigError if the file cannot be read or parsed.
	///
	static BuildConfig from_file(std::filesystem::path const& path);
	///
	/// \brief Parse JSON text on top of defaults.
	///
	static BuildConfig parse(std::string_view json_text);
};

///
/// \brief Parse a codepoint written as U+XXXX, 0xXXXX, or decimal.
///
/// Throws ConfigError if text is malformed or not a mappable codepoint.
///
Codepoint parse_codepoint_value(std::string_view text);

///
/// \brief Parse a comma separated list of integers ("32,64,128").
///
/// Throws ConfigError if any element is not an integer.
///
std::vector<std::int64_t> parse_strike_list(std::string_view text);

///
/// \brief Parse an allocation mode name (standard / legacy).
///
/// Throws ConfigError on an unknown name.
///
AllocationMode parse_allocation_mode(std::string_view text);
} // namespace fontaku
