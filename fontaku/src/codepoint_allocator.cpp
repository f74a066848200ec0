#include <fmt/format.h>
#include <fontaku/codepoint_allocator.hpp>
#include <fontaku/error.hpp>
#include <fontaku/source_scanner.hpp>
#include <algorithm>
#include <iterator>

namespace fontaku {
namespace {
void ensure_not_empty(std::span<SourceImage const> images) {
	if (images.empty()) { throw EmptyInputError{"no source images to allocate"}; }
}

AllocatedGlyph make_glyph(Codepoint const cp, SourceImage source) {
	return AllocatedGlyph{.identity = {.name = make_glyph_name(cp), .codepoint = cp}, .source = std::move(source)};
}
} // namespace

std::vector<GlyphIdentity> Allocation::glyph_order() const {
	auto ret = std::vector<GlyphIdentity>{};
	ret.reserve(glyph_count());
	ret.push_back(GlyphIdentity::notdef());
	for (auto const& glyph : glyphs) { ret.push_back(glyph.identity); }
	return ret;
}

std::unique_ptr<CodepointAllocator> CodepointAllocator::make(AllocationMode const mode, Codepoint const base) {
	switch (mode) {
	case AllocationMode::eLegacy: return std::make_unique<Filename>();
	default: break;
	}
	return std::make_unique<Sequential>(base);
}

Allocation CodepointAllocator::Sequential::allocate(std::vector<SourceImage> images) const {
	ensure_not_empty(images);
	if (!is_mappable(base)) { throw InvalidCodepointError{fmt::format("invalid base codepoint: {}", to_string(base))}; }
	auto const last = std::uint64_t{to_u32(base)} + images.size() - 1;
	if (last > to_u32(Codepoint::eMax)) {
		throw InvalidCodepointError{fmt::format("{} images starting at {} exceed the Unicode range", images.size(), to_string(base))};
	}

	auto ret = Allocation{};
	ret.glyphs.reserve(images.size());
	for (std::size_t i = 0; i < images.size(); ++i) {
		auto const cp = Codepoint{static_cast<std::uint32_t>(to_u32(base) + i)};
		if (!is_mappable(cp)) { throw InvalidCodepointError{fmt::format("cannot assign {} to {}", to_string(cp), images[i].filename())}; }
		ret.glyphs.push_back(make_glyph(cp, std::move(images[i])));
	}
	return ret;
}

Codepoint CodepointAllocator::Filename::parse_stem(std::string_view const stem) {
	if (!has_codepoint_prefix(stem)) { throw InvalidCodepointError{fmt::format("expected U+<hex> file name, got: {}", stem)}; }
	auto const ret = parse_hex(stem.substr(2));
	if (!ret) { throw InvalidCodepointError{fmt::format("invalid hex codepoint in file name: {}", stem)}; }
	if (!is_mappable(*ret)) { throw InvalidCodepointError{fmt::format("{} is not a mappable codepoint ({})", to_string(*ret), stem)}; }
	return *ret;
}

Allocation CodepointAllocator::Filename::allocate(std::vector<SourceImage> images) const {
	ensure_not_empty(images);

	auto ret = Allocation{};
	ret.glyphs.reserve(images.size());
	for (auto& image : images) {
		auto const cp = parse_stem(image.stem());
		ret.glyphs.push_back(make_glyph(cp, std::move(image)));
	}
	std::ranges::sort(ret.glyphs, [](AllocatedGlyph const& a, AllocatedGlyph const& b) { return a.identity.codepoint < b.identity.codepoint; });
	auto const duplicate = std::ranges::adjacent_find(ret.glyphs, [](AllocatedGlyph const& a, AllocatedGlyph const& b) { return a.identity.codepoint == b.identity.codepoint; });
	if (duplicate != ret.glyphs.end()) {
		throw InvalidCodepointError{fmt::format("{} named by both {} and {}", to_string(duplicate->identity.codepoint), duplicate->source.filename(),
												std::next(duplicate)->source.filename())};
	}
	return ret;
}
} // namespace fontaku
