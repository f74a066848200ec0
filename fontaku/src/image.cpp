#include <stb/stb_image.h>
#include <stb/stb_image_resize.h>
#include <stb/stb_image_write.h>
#include <fmt/format.h>
#include <fontaku/error.hpp>
#include <fontaku/image.hpp>
#include <fstream>
#include <iterator>

namespace fontaku {
namespace {
std::vector<std::byte> read_file(char const* file_path) {
	auto file = std::ifstream{file_path, std::ios::binary | std::ios::ate};
	if (!file) { throw UnreadableImageError{fmt::format("failed to open image file: {}", file_path)}; }
	auto const size = file.tellg();
	if (size <= 0) { throw UnreadableImageError{fmt::format("image file is empty: {}", file_path)}; }
	file.seekg(0, std::ios::beg);
	auto ret = std::vector<std::byte>(static_cast<std::size_t>(size));
	if (!file.read(reinterpret_cast<char*>(ret.data()), static_cast<std::streamsize>(ret.size()))) {
		throw UnreadableImageError{fmt::format("failed to read image file: {}", file_path)};
	}
	return ret;
}

char const* failure_reason() {
	auto const* ret = stbi_failure_reason();
	return ret ? ret : "unknown error";
}

void append_bytes(void* context, void* data, int size) {
	auto& out = *static_cast<std::vector<std::byte>*>(context);
	auto const* first = static_cast<std::byte const*>(data);
	out.insert(out.end(), first, first + size);
}
} // namespace

void Image::Storage::Deleter::operator()(Storage const& image) const {
	if (image.data) { stbi_image_free(const_cast<std::byte*>(image.data)); }
}

Image::Image(std::span<std::byte const> compressed, std::string name) : m_name{std::move(name)} {
	int x, y, channels;
	auto ptr = stbi_load_from_memory(reinterpret_cast<stbi_uc const*>(compressed.data()), static_cast<int>(compressed.size()), &x, &y, &channels, 4);
	if (!ptr) { throw UnreadableImageError{fmt::format("failed to decode image [{}]: {}", m_name, failure_reason())}; }
	m_storage = Storage{static_cast<std::size_t>(x) * static_cast<std::size_t>(y) * 4, reinterpret_cast<std::byte const*>(ptr)};
	m_extent = glm::uvec2{glm::ivec2{x, y}};
}

Image::Image(char const* file_path) : Image(read_file(file_path), file_path) {}

auto Image::view() const -> View { return View{.bytes = m_storage.get().bytes(), .extent = m_extent}; }

Image::operator bool() const {
	if (m_extent.x == 0 || m_extent.y == 0) { return false; }
	return m_storage.get().data != nullptr;
}

Extent2D read_image_extent(char const* file_path) {
	int x, y, channels;
	if (!stbi_info(file_path, &x, &y, &channels)) {
		throw UnreadableImageError{fmt::format("failed to read image header: {} ({})", file_path, failure_reason())};
	}
	return Extent2D{glm::ivec2{x, y}};
}

DynPixelMap resize(PixelMap::View const source, Extent2D const target) {
	if (target.x == 0 || target.y == 0) { throw InvalidSizeError{fmt::format("invalid resize target: {}x{}", target.x, target.y)}; }
	auto ret = DynPixelMap{target};
	auto const* in = reinterpret_cast<unsigned char const*>(source.bytes.data());
	auto* out = reinterpret_cast<unsigned char*>(ret.span().data());
	auto const in_w = static_cast<int>(source.extent.x);
	auto const in_h = static_cast<int>(source.extent.y);
	auto const out_w = static_cast<int>(target.x);
	auto const out_h = static_cast<int>(target.y);
	// 4 channels, alpha in channel 3, colour weighted by alpha
	auto const result = stbir_resize_uint8_generic(in, in_w, in_h, in_w * 4, out, out_w, out_h, out_w * 4, 4, 3, 0, STBIR_EDGE_CLAMP,
												   STBIR_FILTER_CATMULLROM, STBIR_COLORSPACE_SRGB, nullptr);
	if (result != 1) { throw UnreadableImageError{fmt::format("failed to resize image to {}x{}", target.x, target.y)}; }
	return ret;
}

std::vector<std::byte> encode_png(PixelMap const& pixels) {
	auto ret = std::vector<std::byte>{};
	auto const extent = pixels.extent();
	auto const w = static_cast<int>(extent.x);
	auto const h = static_cast<int>(extent.y);
	if (!stbi_write_png_to_func(&append_bytes, &ret, w, h, 4, pixels.span().data(), w * 4)) {
		throw SerializationError{fmt::format("failed to encode {}x{} PNG", w, h)};
	}
	return ret;
}
} // namespace fontaku
