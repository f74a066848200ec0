#include <fmt/format.h>
#include <fontaku/error.hpp>
#include <fontaku/source_scanner.hpp>
#include <algorithm>
#include <cctype>

namespace fontaku {
namespace fs = std::filesystem;

bool is_png_path(fs::path const& path) {
	auto const ext = path.extension().string();
	if (ext.size() != 4) { return false; }
	auto lower = std::string{};
	for (char const c : ext) { lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
	return lower == ".png";
}

bool has_codepoint_prefix(std::string_view const stem) { return stem.size() > 2 && (stem[0] == 'U' || stem[0] == 'u') && stem[1] == '+'; }

std::vector<SourceImage> scan_directory(fs::path const& directory, AllocationMode const mode) {
	auto ec = std::error_code{};
	if (!fs::is_directory(directory, ec)) { throw EmptyInputError{fmt::format("input directory not found: {}", directory.generic_string())}; }

	auto paths = std::vector<fs::path>{};
	for (auto const& entry : fs::directory_iterator{directory, ec}) {
		auto entry_ec = std::error_code{};
		if (!entry.is_regular_file(entry_ec) || !is_png_path(entry.path())) { continue; }
		if (mode == AllocationMode::eLegacy && !has_codepoint_prefix(entry.path().stem().string())) { continue; }
		paths.push_back(entry.path());
	}
	if (ec) { throw EmptyInputError{fmt::format("failed to scan input directory: {} ({})", directory.generic_string(), ec.message())}; }
	if (paths.empty()) { throw EmptyInputError{fmt::format("no {} PNG files found in: {}", allocation_mode_names_v[mode], directory.generic_string())}; }

	std::ranges::sort(paths, [](fs::path const& a, fs::path const& b) { return a.filename().string() < b.filename().string(); });
	auto ret = std::vector<SourceImage>{};
	ret.reserve(paths.size());
	for (auto& path : paths) { ret.emplace_back(std::move(path)); }
	return ret;
}
} // namespace fontaku
