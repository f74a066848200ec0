#include <fixtures.hpp>
#include <fontaku/codepoint_allocator.hpp>
#include <fontaku/error.hpp>
#include <fontaku/source_scanner.hpp>
#include <test/test.hpp>

namespace {
using namespace fontaku;

std::vector<SourceImage> make_sources(std::initializer_list<std::string_view> filenames) {
	auto ret = std::vector<SourceImage>{};
	for (auto const filename : filenames) { ret.emplace_back(std::filesystem::path{"images"} / filename); }
	return ret;
}

ADD_TEST(SequentialAllocation) {
	auto const allocator = CodepointAllocator::make(AllocationMode::eStandard, Codepoint{0x1f600});
	auto const allocation = allocator->allocate(make_sources({"a.png", "b.png", "c.png"}));
	ASSERT(allocation.glyphs.size() == 3u);
	EXPECT(allocation.glyph_count() == 4u);
	EXPECT(allocation.glyphs[0].identity.name == "uni1F600");
	EXPECT(allocation.glyphs[1].identity.codepoint == Codepoint{0x1f601});
	EXPECT(allocation.glyphs[2].identity.name == "uni1F602");
	EXPECT(allocation.glyphs[2].source.filename() == "c.png");

	auto const order = allocation.glyph_order();
	ASSERT(order.size() == 4u);
	EXPECT(order.front().name == ".notdef");
	EXPECT(order.front().is_notdef());
	for (std::size_t i = 2; i < order.size(); ++i) { EXPECT(order[i - 1].codepoint < order[i].codepoint); }
}

ADD_TEST(SequentialRejectsOverflow) {
	auto const allocator = CodepointAllocator::Sequential{Codepoint{0x10fffe}};
	EXPECT(allocator.allocate(make_sources({"a.png", "b.png"})).glyphs.size() == 2u);
	EXPECT(fixture::throws<InvalidCodepointError>([&] { allocator.allocate(make_sources({"a.png", "b.png", "c.png"})); }));

	// U+FFFE and U+FFFF cannot be mapped
	auto const bmp_end = CodepointAllocator::Sequential{Codepoint{0xfffd}};
	EXPECT(fixture::throws<InvalidCodepointError>([&] { bmp_end.allocate(make_sources({"a.png", "b.png"})); }));

	auto const surrogate = CodepointAllocator::Sequential{Codepoint{0xd7ff}};
	EXPECT(fixture::throws<InvalidCodepointError>([&] { surrogate.allocate(make_sources({"a.png", "b.png"})); }));
}

ADD_TEST(AllocateEmpty) {
	EXPECT(fixture::throws<EmptyInputError>([] { CodepointAllocator::Sequential{}.allocate({}); }));
	EXPECT(fixture::throws<EmptyInputError>([] { CodepointAllocator::Filename{}.allocate({}); }));
}

ADD_TEST(FilenameAllocation) {
	auto const allocator = CodepointAllocator::make(AllocationMode::eLegacy);
	auto const allocation = allocator->allocate(make_sources({"U+1F602.png", "u+41.png", "U+1f600.png"}));
	ASSERT(allocation.glyphs.size() == 3u);
	EXPECT(allocation.glyphs[0].identity.codepoint == Codepoint{0x41});
	EXPECT(allocation.glyphs[0].identity.name == "uni0041");
	EXPECT(allocation.glyphs[1].identity.name == "uni1F600");
	EXPECT(allocation.glyphs[1].source.filename() == "U+1f600.png");
	EXPECT(allocation.glyphs[2].identity.name == "uni1F602");
}

ADD_TEST(FilenameRejectsInvalid) {
	EXPECT(CodepointAllocator::Filename::parse_stem("U+E000") == Codepoint{0xe000});
	EXPECT(fixture::throws<InvalidCodepointError>([] { CodepointAllocator::Filename::parse_stem("smile"); }));
	EXPECT(fixture::throws<InvalidCodepointError>([] { CodepointAllocator::Filename::parse_stem("U+"); }));
	EXPECT(fixture::throws<InvalidCodepointError>([] { CodepointAllocator::Filename::parse_stem("U+XYZ"); }));
	EXPECT(fixture::throws<InvalidCodepointError>([] { CodepointAllocator::Filename::parse_stem("U+0"); }));
	EXPECT(fixture::throws<InvalidCodepointError>([] { CodepointAllocator::Filename::parse_stem("U+D800"); }));
	EXPECT(fixture::throws<InvalidCodepointError>([] { CodepointAllocator::Filename::parse_stem("U+110000"); }));

	auto const allocator = CodepointAllocator::Filename{};
	EXPECT(fixture::throws<InvalidCodepointError>([&] { allocator.allocate(make_sources({"U+1F600.png", "u+1f600.png"})); }));
}

ADD_TEST(ScanDirectory) {
	auto const dir = fixture::ScratchDir{"scan"};
	fixture::write_png(dir / "b.png", {2, 2});
	fixture::write_png(dir / "a.PNG", {2, 2});
	fixture::write_png(dir / "U+1F600.png", {2, 2});
	fixture::write_png(dir / "c.jpg", {2, 2});
	std::filesystem::create_directories(dir / "nested.png");

	auto const standard = scan_directory(dir.path(), AllocationMode::eStandard);
	ASSERT(standard.size() == 3u);
	EXPECT(standard[0].filename() == "U+1F600.png");
	EXPECT(standard[1].filename() == "a.PNG");
	EXPECT(standard[2].filename() == "b.png");
	EXPECT(standard[2].extent() == Extent2D{2, 2});

	auto const legacy = scan_directory(dir.path(), AllocationMode::eLegacy);
	ASSERT(legacy.size() == 1u);
	EXPECT(legacy[0].stem() == "U+1F600");

	EXPECT(fixture::throws<EmptyInputError>([&] { scan_directory(dir / "missing", AllocationMode::eStandard); }));
	EXPECT(fixture::throws<EmptyInputError>([&] { scan_directory(dir / "b.png", AllocationMode::eStandard); }));
	auto const empty = fixture::ScratchDir{"scan-empty"};
	EXPECT(fixture::throws<EmptyInputError>([&] { scan_directory(empty.path(), AllocationMode::eStandard); }));
}
} // namespace
