#include <fixtures.hpp>
#include <fontaku/error.hpp>
#include <fontaku/image_transformer.hpp>
#include <test/test.hpp>

namespace {
using namespace fontaku;

Image make_image(Extent2D const extent, Rgba const fill) {
	auto const png = encode_png(DynPixelMap{extent, fill});
	return Image{png, "fixture"};
}

ADD_TEST(FitPreservesAspect) {
	auto placement = fit_to_square({200, 100}, 64);
	EXPECT(placement.size == Extent2D{64, 32});
	EXPECT(placement.offset == Index2D{0, 16});

	placement = fit_to_square({100, 200}, 64);
	EXPECT(placement.size == Extent2D{32, 64});
	EXPECT(placement.offset == Index2D{16, 0});

	placement = fit_to_square({16, 16}, 256);
	EXPECT(placement.size == Extent2D{256, 256});
	EXPECT(placement.offset == Index2D{0, 0});
}

ADD_TEST(FitCentersWithRemainderOnFarSide) {
	auto const placement = fit_to_square({3, 2}, 4);
	EXPECT(placement.size == Extent2D{4, 3});
	EXPECT(placement.offset == Index2D{0, 0});

	auto const wide = fit_to_square({7, 2}, 32);
	// 2 * 32 / 7 = 9.14
	EXPECT(wide.size == Extent2D{32, 9});
	EXPECT(wide.offset.y == 11u);
	EXPECT(wide.offset.y + wide.size.y + wide.offset.y + 1 == 32u);
}

ADD_TEST(FitClampsThinEdges) {
	auto const placement = fit_to_square({1000, 1}, 32);
	EXPECT(placement.size == Extent2D{32, 1});
	EXPECT(placement.offset == Index2D{0, 15});
}

ADD_TEST(FitRejectsInvalid) {
	EXPECT(fixture::throws<InvalidSizeError>([] { fit_to_square({10, 10}, 0); }));
	EXPECT(fixture::throws<InvalidSizeError>([] { fit_to_square({10, 10}, -32); }));
	EXPECT(fixture::throws<UnreadableImageError>([] { fit_to_square({0, 10}, 32); }));
}

ADD_TEST(TransformToSquareCanvas) {
	auto const image = make_image({20, 10}, red_v);
	ASSERT(static_cast<bool>(image));
	auto const bitmap = transform(image, 32);
	EXPECT(bitmap.size() == 32u);
	EXPECT(bitmap.canvas.extent() == Extent2D{32, 32});
	EXPECT(bitmap.placement.size == Extent2D{32, 16});
	EXPECT(bitmap.placement.offset == Index2D{0, 8});
	EXPECT(bitmap.canvas[{0, 0}] == clear_v);
	EXPECT(bitmap.canvas[{31, 31}] == clear_v);
	EXPECT(bitmap.canvas[{16, 16}].alpha() > 0);
	EXPECT(!bitmap.png.empty());

	auto const decoded = Image{bitmap.png};
	EXPECT(decoded.extent() == Extent2D{32, 32});
}

ADD_TEST(TransformIsDeterministic) {
	auto const image = make_image({13, 7}, blue_v);
	auto const a = transform(image, 64);
	auto const b = transform(image, 64);
	EXPECT(a.png == b.png);
}

ADD_TEST(TransformSourceFile) {
	auto const dir = fixture::ScratchDir{"transform"};
	fixture::write_half_png(dir / "half.png", {16, 16});
	auto const bitmap = transform(SourceImage{dir / "half.png"}, 32);
	EXPECT(bitmap.canvas[{2, 16}].alpha() == 0xff);
	EXPECT(bitmap.canvas[{30, 16}].alpha() == 0);

	EXPECT(fixture::throws<UnreadableImageError>([&] { transform(SourceImage{dir / "missing.png"}, 32); }));
	EXPECT(fixture::throws<InvalidSizeError>([&] { transform(SourceImage{dir / "half.png"}, 0); }));
}

ADD_TEST(TransformOpaqueSource) {
	auto const dir = fixture::ScratchDir{"transform-rgb"};
	fixture::write_rgb_png(dir / "rgb.png", {20, 10}, blue_v);
	auto const bitmap = transform(SourceImage{dir / "rgb.png"}, 32);
	EXPECT(bitmap.placement.size == Extent2D{32, 16});
	EXPECT(bitmap.placement.offset == Index2D{0, 8});
	for (std::size_t y = 8; y < 24; ++y) {
		for (std::size_t x = 0; x < 32; ++x) { EXPECT(bitmap.canvas[{x, y}].alpha() == 0xff); }
	}
	auto const centre = bitmap.canvas[{16, 16}];
	EXPECT(centre.channels.x <= 1 && centre.channels.z >= 0xfe);
	for (std::size_t x = 0; x < 32; ++x) {
		EXPECT(bitmap.canvas[{x, 7}] == clear_v);
		EXPECT(bitmap.canvas[{x, 24}] == clear_v);
	}
}

ADD_TEST(DecodeRejectsGarbage) {
	auto const garbage = std::vector<std::byte>(64, std::byte{0x42});
	EXPECT(fixture::throws<UnreadableImageError>([&] { Image{garbage, "garbage"}; }));
}
} // namespace
