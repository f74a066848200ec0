#include <fmt/format.h>
#include <fontaku/error.hpp>
#include <fontaku/image_transformer.hpp>
#include <algorithm>
#include <limits>

namespace fontaku {
namespace {
constexpr std::int64_t max_target_v{std::numeric_limits<std::uint16_t>::max()};

void validate_target(std::int64_t const target) {
	if (target <= 0 || target > max_target_v) { throw InvalidSizeError{fmt::format("invalid target size: {}", target)}; }
}

// round(edge * target / longest), half away from zero
std::uint32_t scale_edge(std::uint64_t const edge, std::uint64_t const target, std::uint64_t const longest) {
	auto const ret = (2 * edge * target + longest) / (2 * longest);
	return static_cast<std::uint32_t>(std::clamp<std::uint64_t>(ret, 1, target));
}
} // namespace

Placement fit_to_square(Extent2D const source, std::int64_t const target) {
	validate_target(target);
	if (source.x == 0 || source.y == 0) { throw UnreadableImageError{fmt::format("source has no pixels: {}x{}", source.x, source.y)}; }
	auto const longest = std::max(source.x, source.y);
	auto const t = static_cast<std::uint64_t>(target);
	auto ret = Placement{};
	ret.size = {scale_edge(source.x, t, longest), scale_edge(source.y, t, longest)};
	ret.offset = (Index2D{t, t} - Index2D{ret.size}) / std::size_t{2};
	return ret;
}

RenderedBitmap transform(Image const& image, std::int64_t const target) {
	validate_target(target);
	if (!image) { throw UnreadableImageError{fmt::format("image has no pixels: {}", image.name())}; }
	auto const edge = static_cast<std::uint32_t>(target);
	auto ret = RenderedBitmap{.placement = fit_to_square(image.extent(), target)};
	auto const scaled = resize(image.view(), ret.placement.size);
	ret.canvas = DynPixelMap{Extent2D{edge, edge}, clear_v};
	ret.canvas.paste(scaled, ret.placement.offset);
	ret.png = encode_png(ret.canvas);
	return ret;
}

RenderedBitmap transform(SourceImage const& source, std::int64_t const target) {
	validate_target(target);
	return transform(source.decode(), target);
}
} // namespace fontaku
