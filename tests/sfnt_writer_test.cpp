#include <fixtures.hpp>
#include <fontaku/error.hpp>
#include <fontaku/sfnt/writer.hpp>
#include <test/test.hpp>
#include <array>
#include <fstream>
#include <string>

namespace {
using namespace fontaku;

std::uint32_t read_u16(std::span<std::byte const> bytes, std::size_t offset) {
	return (static_cast<std::uint32_t>(bytes[offset]) << 8) | static_cast<std::uint32_t>(bytes[offset + 1]);
}

std::uint32_t read_u32(std::span<std::byte const> bytes, std::size_t offset) { return (read_u16(bytes, offset) << 16) | read_u16(bytes, offset + 2); }

struct TableRecord {
	std::string tag{};
	std::uint32_t checksum{};
	std::uint32_t offset{};
	std::uint32_t length{};
};

std::vector<TableRecord> read_directory(std::span<std::byte const> bytes) {
	auto ret = std::vector<TableRecord>{};
	auto const count = read_u16(bytes, 4);
	for (std::size_t i = 0; i < count; ++i) {
		auto const entry = 12 + 16 * i;
		auto& record = ret.emplace_back();
		for (std::size_t c = 0; c < 4; ++c) { record.tag += static_cast<char>(bytes[entry + c]); }
		record.checksum = read_u32(bytes, entry + 4);
		record.offset = read_u32(bytes, entry + 8);
		record.length = read_u32(bytes, entry + 12);
	}
	return ret;
}

TableRecord const& find_table(std::vector<TableRecord> const& directory, std::string_view tag) {
	for (auto const& record : directory) {
		if (record.tag == tag) { return record; }
	}
	throw std::runtime_error{"missing table"};
}

ADD_TEST(ChecksumPadsTail) {
	auto const bytes = std::array{std::byte{0x00}, std::byte{0x00}, std::byte{0x01}, std::byte{0x00}, std::byte{0x02}};
	EXPECT(sfnt::checksum(bytes) == 0x100u + 0x02000000u);
	EXPECT(sfnt::checksum({}) == 0u);
}

ADD_TEST(OffsetTableAndDirectory) {
	auto const bytes = sfnt::serialize(fixture::make_document(4, {32, 64}));
	auto const span = std::span<std::byte const>{bytes};
	EXPECT(read_u32(span, 0) == 0x00010000u);
	EXPECT(read_u16(span, 4) == 11u);
	EXPECT(read_u16(span, 6) == 128u);
	EXPECT(read_u16(span, 8) == 3u);
	EXPECT(read_u16(span, 10) == 48u);

	auto const directory = read_directory(span);
	auto const expected = std::array<std::string_view, 11>{"OS/2", "cmap", "glyf", "head", "hhea", "hmtx", "loca", "maxp", "name", "post", "sbix"};
	ASSERT(directory.size() == expected.size());
	for (std::size_t i = 0; i < expected.size(); ++i) {
		auto const& record = directory[i];
		EXPECT(record.tag == expected[i]);
		EXPECT(record.offset % 4 == 0);
		ASSERT(record.offset + record.length <= bytes.size());
		if (record.tag == "head") { continue; }
		EXPECT(sfnt::checksum(span.subspan(record.offset, record.length)) == record.checksum);
	}
	EXPECT(bytes.size() % 4 == 0);
}

ADD_TEST(WholeFontChecksum) {
	auto const bytes = sfnt::serialize(fixture::make_document(3, {32}));
	EXPECT(sfnt::checksum(bytes) == sfnt::checksum_magic_v);

	auto const directory = read_directory(bytes);
	auto const& head = find_table(directory, "head");
	auto const span = std::span<std::byte const>{bytes};
	EXPECT(head.length == 54u);
	EXPECT(read_u32(span, head.offset + 12) == 0x5f0f3cf5u);
	EXPECT(read_u16(span, head.offset + 18) == 800u);
	auto const created = (std::uint64_t{read_u32(span, head.offset + 20)} << 32) | read_u32(span, head.offset + 24);
	EXPECT(created == 1700000000u + sfnt::mac_epoch_offset_v);
}

ADD_TEST(FixedSizeTables) {
	auto const bytes = sfnt::serialize(fixture::make_document(4, {32}));
	auto const span = std::span<std::byte const>{bytes};
	auto const directory = read_directory(span);

	auto const& maxp = find_table(directory, "maxp");
	EXPECT(maxp.length == 32u);
	EXPECT(read_u16(span, maxp.offset + 4) == 4u);

	auto const& hhea = find_table(directory, "hhea");
	EXPECT(hhea.length == 36u);
	EXPECT(read_u16(span, hhea.offset + 34) == 4u);

	EXPECT(find_table(directory, "OS/2").length == 96u);
	EXPECT(find_table(directory, "hmtx").length == 16u);
	EXPECT(find_table(directory, "loca").length == 10u);
	EXPECT(find_table(directory, "glyf").length == 1u);
}

ADD_TEST(SbixLayout) {
	auto const document = fixture::make_document(3, {32, 64});
	auto const bytes = sfnt::serialize(document);
	auto const span = std::span<std::byte const>{bytes};
	auto const& sbix = find_table(read_directory(span), "sbix");
	EXPECT(read_u16(span, sbix.offset) == 1u);
	EXPECT(read_u16(span, sbix.offset + 2) == 1u);
	ASSERT(read_u32(span, sbix.offset + 4) == 2u);

	for (std::size_t s = 0; s < 2; ++s) {
		auto const& strike = document.bitmap_table().strikes[s];
		auto const strike_offset = sbix.offset + read_u32(span, sbix.offset + 8 + 4 * s);
		EXPECT(read_u16(span, strike_offset) == strike.spec().ppem);
		EXPECT(read_u16(span, strike_offset + 2) == 72u);
		auto const glyph_offset = [&](std::size_t i) { return read_u32(span, strike_offset + 4 + 4 * i); };
		// .notdef has no data
		EXPECT(glyph_offset(0) == glyph_offset(1));
		for (std::size_t g = 1; g < 3; ++g) {
			auto const& glyph = strike.glyphs()[g];
			EXPECT(glyph_offset(g + 1) - glyph_offset(g) == 8 + glyph.data.size());
			auto const record = strike_offset + glyph_offset(g);
			EXPECT(static_cast<std::int16_t>(read_u16(span, record + 2)) == glyph.origin.y);
			EXPECT(read_u32(span, record + 4) == 0x706e6720u);
		}
	}
}

ADD_TEST(SerializeIsDeterministic) {
	auto const a = sfnt::serialize(fixture::make_document(5, {32, 64, 128}));
	auto const b = sfnt::serialize(fixture::make_document(5, {32, 64, 128}));
	EXPECT(a == b);
}

ADD_TEST(SaveReplacesAtomically) {
	auto const dir = fixture::ScratchDir{"save"};
	auto const path = dir / "out.ttf";
	auto const document = fixture::make_document(3, {32});
	sfnt::save(document, path);
	EXPECT(std::filesystem::is_regular_file(path));
	EXPECT(!std::filesystem::exists(dir / "out.ttf.tmp"));
	EXPECT(std::filesystem::file_size(path) == sfnt::serialize(document).size());

	EXPECT(fixture::throws<SerializationError>([&] { sfnt::save(document, dir / "missing" / "out.ttf"); }));
	EXPECT(!std::filesystem::exists(dir / "missing"));
}
} // namespace
