#include <fmt/format.h>
#include <fontaku/error.hpp>
#include <fontaku/sfnt/writer.hpp>
#include <sfnt/byte_writer.hpp>
#include <algorithm>
#include <cassert>
#include <fstream>
#include <limits>
#include <string>
#include <unordered_map>

namespace fontaku::sfnt {
namespace {
constexpr std::size_t header_size_v{12};
constexpr std::size_t directory_entry_size_v{16};
constexpr std::uint16_t max_u16_v{std::numeric_limits<std::uint16_t>::max()};
// glyph names in post format 2 are Pascal strings
constexpr std::size_t max_post_name_v{255};
constexpr std::uint32_t bmp_last_v{0xffff};

constexpr std::uint16_t integral_log2(std::uint32_t x) {
	auto ret = std::uint16_t{};
	while (x >>= 1) { ++ret; }
	return ret;
}

template <typename Type>
Type checked_cast(std::size_t const value, std::string_view what) {
	if (value > std::numeric_limits<Type>::max()) { throw SerializationError{fmt::format("{} overflows ({} > {})", what, value, std::numeric_limits<Type>::max())}; }
	return static_cast<Type>(value);
}

// Scale a value defined for a 1000 unit em.
std::int16_t scale_from_1000(int const value, std::uint16_t const units_per_em) {
	return static_cast<std::int16_t>((value * static_cast<int>(units_per_em) + (value >= 0 ? 500 : -500)) / 1000);
}

constexpr std::uint32_t to_tag_value(std::string_view const tag) {
	auto ret = std::uint32_t{};
	for (char const c : tag) { ret = (ret << 8) | static_cast<std::uint8_t>(c); }
	return ret;
}

struct Table {
	std::string_view tag{};
	std::vector<std::byte> data{};
};

using GlyphIds = std::unordered_map<std::string_view, std::uint16_t>;

GlyphIds make_glyph_ids(std::vector<std::string> const& glyph_order) {
	auto ret = GlyphIds{};
	for (std::size_t i = 0; i < glyph_order.size(); ++i) { ret.emplace(glyph_order[i], static_cast<std::uint16_t>(i)); }
	return ret;
}

struct Mapping {
	std::uint32_t codepoint{};
	std::uint16_t glyph_id{};
};

std::vector<Mapping> make_mappings(CharacterMap const& character_map, GlyphIds const& glyph_ids) {
	auto ret = std::vector<Mapping>{};
	ret.reserve(character_map.size());
	for (auto const& [codepoint, name] : character_map) {
		auto const it = glyph_ids.find(name);
		if (it == glyph_ids.end()) { throw SerializationError{fmt::format("{} maps to unknown glyph: {}", to_string(codepoint), name)}; }
		ret.push_back(Mapping{to_u32(codepoint), it->second});
	}
	return ret;
}

///
/// \brief Run of consecutive codepoints mapped to consecutive glyph ids.
///
struct Run {
	std::uint32_t first{};
	std::uint32_t last{};
	std::uint16_t first_glyph{};
};

std::vector<Run> make_runs(std::span<Mapping const> mappings) {
	auto ret = std::vector<Run>{};
	for (auto const& mapping : mappings) {
		if (!ret.empty()) {
			auto& run = ret.back();
			if (mapping.codepoint == run.last + 1 && mapping.glyph_id == run.first_glyph + (mapping.codepoint - run.first)) {
				run.last = mapping.codepoint;
				continue;
			}
		}
		ret.push_back(Run{mapping.codepoint, mapping.codepoint, mapping.glyph_id});
	}
	return ret;
}

// invalid sequences decode to U+FFFD
std::vector<std::uint32_t> decode_utf8(std::string_view const text) {
	constexpr std::uint32_t replacement_v{0xfffd};
	constexpr std::array<std::uint32_t, 5> min_value_v{0, 0, 0x80, 0x800, 0x10000};
	auto ret = std::vector<std::uint32_t>{};
	for (std::size_t i = 0; i < text.size();) {
		auto const lead = static_cast<std::uint8_t>(text[i]);
		auto length = std::size_t{};
		auto cp = std::uint32_t{};
		if (lead < 0x80) {
			length = 1;
			cp = lead;
		} else if ((lead & 0xe0u) == 0xc0u) {
			length = 2;
			cp = lead & 0x1fu;
		} else if ((lead & 0xf0u) == 0xe0u) {
			length = 3;
			cp = lead & 0x0fu;
		} else if ((lead & 0xf8u) == 0xf0u) {
			length = 4;
			cp = lead & 0x07u;
		}
		auto valid = length > 0 && i + length <= text.size();
		for (std::size_t j = 1; valid && j < length; ++j) {
			auto const next = static_cast<std::uint8_t>(text[i + j]);
			valid = (next & 0xc0u) == 0x80u;
			cp = (cp << 6) | (next & 0x3fu);
		}
		if (!valid || cp < min_value_v[length] || !is_scalar_value(Codepoint{cp})) {
			ret.push_back(replacement_v);
			++i;
			continue;
		}
		ret.push_back(cp);
		i += length;
	}
	return ret;
}

std::vector<std::byte> encode_utf16be(std::string_view const text) {
	auto out = ByteWriter{};
	for (auto cp : decode_utf8(text)) {
		if (cp > 0xffff) {
			cp -= 0x10000;
			out.append16(static_cast<std::uint16_t>(0xd800 + (cp >> 10)));
			out.append16(static_cast<std::uint16_t>(0xdc00 + (cp & 0x3ff)));
		} else {
			out.append16(static_cast<std::uint16_t>(cp));
		}
	}
	return out.release();
}

// Mac Roman agrees with ASCII below 0x80; everything else is written as '?'.
std::vector<std::byte> encode_mac_roman(std::string_view const text) {
	auto out = ByteWriter{};
	for (auto const cp : decode_utf8(text)) { out.append8(cp < 0x80 ? static_cast<std::uint8_t>(cp) : std::uint8_t{'?'}); }
	return out.release();
}

class TableWriter {
  public:
	explicit TableWriter(FontDocument const& document)
		: m_tables(document.tables()), m_glyph_ids(make_glyph_ids(m_tables.glyph_order)),
		  m_mappings(make_mappings(m_tables.character_map, m_glyph_ids)) {}

	std::vector<Table> write_all() const {
		// sorted by tag
		auto ret = std::vector<Table>{};
		ret.push_back({"OS/2", write_os2()});
		ret.push_back({"cmap", write_cmap()});
		ret.push_back({"glyf", write_glyf()});
		ret.push_back({"head", write_head()});
		ret.push_back({"hhea", write_hhea()});
		ret.push_back({"hmtx", write_hmtx()});
		ret.push_back({"loca", write_loca()});
		ret.push_back({"maxp", write_maxp()});
		ret.push_back({"name", write_name()});
		ret.push_back({"post", write_post()});
		ret.push_back({"sbix", write_sbix()});
		return ret;
	}

  private:
	std::uint16_t glyph_count() const { return static_cast<std::uint16_t>(m_tables.glyph_order.size()); }

	std::uint16_t advance_width_max() const {
		auto ret = std::uint16_t{};
		for (auto const& metric : m_tables.horizontal_metrics) { ret = std::max(ret, metric.advance_width); }
		return ret;
	}

	std::int16_t average_advance() const {
		auto sum = std::uint64_t{};
		auto count = std::uint64_t{};
		for (auto const& metric : m_tables.horizontal_metrics) {
			if (metric.advance_width == 0) { continue; }
			sum += metric.advance_width;
			++count;
		}
		if (count == 0) { return 0; }
		return static_cast<std::int16_t>((sum + count / 2) / count);
	}

	std::vector<std::byte> write_head() const {
		auto const& head = m_tables.head;
		auto out = ByteWriter{};
		out.append32(0x00010000);
		out.append32(head.font_revision);
		out.append32(0); // checkSumAdjustment, written once the whole font is assembled
		out.append32(0x5f0f3cf5);
		out.append16(head.flags);
		out.append16(head.units_per_em);
		out.append_i64(head.created + mac_epoch_offset_v);
		out.append_i64(head.modified + mac_epoch_offset_v);
		// no outlines: empty bounding box
		out.append_zeros(8);
		out.append16(head.mac_style);
		out.append16(head.lowest_rec_ppem);
		out.append_i16(head.font_direction_hint);
		out.append_i16(0); // indexToLocFormat: short
		out.append_i16(0); // glyphDataFormat
		return out.release();
	}

	std::vector<std::byte> write_hhea() const {
		auto const& hhea = m_tables.horizontal_header;
		auto out = ByteWriter{};
		out.append32(0x00010000);
		out.append_i16(hhea.ascender);
		out.append_i16(hhea.descender);
		out.append_i16(hhea.line_gap);
		out.append16(advance_width_max());
		out.append_i16(0); // minLeftSideBearing
		out.append_i16(0); // minRightSideBearing
		out.append_i16(0); // xMaxExtent
		out.append_i16(1); // caretSlopeRise
		out.append_i16(0); // caretSlopeRun
		out.append_i16(0); // caretOffset
		out.append_zeros(8);
		out.append_i16(0); // metricDataFormat
		out.append16(glyph_count()); // numberOfHMetrics
		return out.release();
	}

	std::vector<std::byte> write_hmtx() const {
		auto out = ByteWriter{};
		for (auto const& metric : m_tables.horizontal_metrics) {
			out.append16(metric.advance_width);
			out.append_i16(metric.left_side_bearing);
		}
		return out.release();
	}

	std::vector<std::byte> write_maxp() const {
		auto out = ByteWriter{};
		out.append32(0x00010000);
		out.append16(glyph_count());
		out.append16(0); // maxPoints
		out.append16(0); // maxContours
		out.append16(0); // maxCompositePoints
		out.append16(0); // maxCompositeContours
		out.append16(2); // maxZones
		out.append_zeros(2 * 8);
		return out.release();
	}

	std::vector<std::byte> write_glyf() const {
		// every glyph is empty; a zero-length table trips some parsers
		auto out = ByteWriter{};
		out.append8(0);
		return out.release();
	}

	std::vector<std::byte> write_loca() const {
		auto out = ByteWriter{};
		for (std::size_t i = 0; i <= m_tables.outlines.size(); ++i) { out.append16(0); }
		return out.release();
	}

	std::uint32_t unicode_range(std::size_t const word) const {
		auto bits = std::array<std::uint32_t, 4>{};
		auto set = [&bits](int const bit) { bits[static_cast<std::size_t>(bit / 32)] |= 1u << (bit % 32); };
		for (auto const& mapping : m_mappings) {
			auto const cp = mapping.codepoint;
			if (cp < 0x80) { set(0); }
			if (cp > bmp_last_v) { set(57); }
			if (cp >= 0xe000 && cp <= 0xf8ff) { set(60); }
			if (cp >= 0xf0000) { set(90); }
		}
		return bits[word];
	}

	std::vector<std::byte> write_os2() const {
		auto const& os2 = m_tables.os2;
		auto const upem = m_tables.head.units_per_em;
		auto out = ByteWriter{};
		out.append16(4); // version
		out.append_i16(average_advance());
		out.append16(os2.weight_class);
		out.append16(os2.width_class);
		out.append16(os2.fs_type);
		out.append_i16(scale_from_1000(650, upem)); // ySubscriptXSize
		out.append_i16(scale_from_1000(600, upem)); // ySubscriptYSize
		out.append_i16(0);							// ySubscriptXOffset
		out.append_i16(scale_from_1000(75, upem));	// ySubscriptYOffset
		out.append_i16(scale_from_1000(650, upem)); // ySuperscriptXSize
		out.append_i16(scale_from_1000(600, upem)); // ySuperscriptYSize
		out.append_i16(0);							// ySuperscriptXOffset
		out.append_i16(scale_from_1000(350, upem)); // ySuperscriptYOffset
		out.append_i16(scale_from_1000(50, upem));	// yStrikeoutSize
		out.append_i16(scale_from_1000(300, upem)); // yStrikeoutPosition
		out.append_i16(0);							// sFamilyClass
		out.append_zeros(10);						// panose
		for (std::size_t i = 0; i < 4; ++i) { out.append32(unicode_range(i)); }
		out.append_tag(os2.vendor_id);
		out.append16(os2.fs_selection);
		auto first = std::uint32_t{};
		auto last = std::uint32_t{};
		if (!m_mappings.empty()) {
			first = m_mappings.front().codepoint;
			last = m_mappings.back().codepoint;
		}
		out.append16(static_cast<std::uint16_t>(std::min(first, bmp_last_v)));
		out.append16(static_cast<std::uint16_t>(std::min(last, bmp_last_v)));
		out.append_i16(os2.typo_ascender);
		out.append_i16(os2.typo_descender);
		out.append_i16(os2.typo_line_gap);
		out.append16(os2.win_ascent);
		out.append16(os2.win_descent);
		out.append32(1); // ulCodePageRange1: Latin 1
		out.append32(0);
		out.append_i16(os2.x_height);
		out.append_i16(os2.cap_height);
		out.append16(0);   // usDefaultChar
		out.append16(' '); // usBreakChar
		out.append16(0);   // usMaxContext
		return out.release();
	}

	std::vector<std::byte> write_cmap_format4() const {
		auto runs = std::vector<Run>{};
		for (auto const& run : make_runs(m_mappings)) {
			if (run.first > bmp_last_v) { break; }
			runs.push_back(run);
			if (runs.back().last > bmp_last_v) { runs.back().last = bmp_last_v; }
		}
		// 0xFFFF terminator
		runs.push_back(Run{bmp_last_v, bmp_last_v, 0});

		auto const seg_count = checked_cast<std::uint16_t>(runs.size(), "cmap format 4 segment count");
		auto const search_range = static_cast<std::uint16_t>(2u << integral_log2(seg_count));
		auto out = ByteWriter{};
		out.append16(4);
		out.append16(0); // length, patched below
		out.append16(0); // language
		out.append16(static_cast<std::uint16_t>(seg_count * 2));
		out.append16(search_range);
		out.append16(integral_log2(seg_count));
		out.append16(static_cast<std::uint16_t>(seg_count * 2 - search_range));
		for (auto const& run : runs) { out.append16(static_cast<std::uint16_t>(run.last)); }
		out.append16(0); // reservedPad
		for (auto const& run : runs) { out.append16(static_cast<std::uint16_t>(run.first)); }
		for (std::size_t i = 0; i < runs.size(); ++i) {
			// terminator maps 0xFFFF to glyph 0
			auto const delta = i + 1 == runs.size() ? std::uint16_t{1} : static_cast<std::uint16_t>(runs[i].first_glyph - runs[i].first);
			out.append16(delta);
		}
		for (std::size_t i = 0; i < runs.size(); ++i) { out.append16(0); } // idRangeOffset
		out.overwrite16(2, checked_cast<std::uint16_t>(out.size(), "cmap format 4 length"));
		return out.release();
	}

	std::vector<std::byte> write_cmap_format12() const {
		auto const runs = make_runs(m_mappings);
		auto out = ByteWriter{};
		out.append16(12);
		out.append16(0); // reserved
		out.append32(static_cast<std::uint32_t>(16 + runs.size() * 12));
		out.append32(0); // language
		out.append32(static_cast<std::uint32_t>(runs.size()));
		for (auto const& run : runs) {
			out.append32(run.first);
			out.append32(run.last);
			out.append32(run.first_glyph);
		}
		return out.release();
	}

	std::vector<std::byte> write_cmap() const {
		auto const format4 = write_cmap_format4();
		auto const format12 = write_cmap_format12();
		struct Record {
			std::uint16_t platform;
			std::uint16_t encoding;
			bool format12;
		};
		constexpr auto records = std::array{
			Record{0, 3, false},
			Record{0, 4, true},
			Record{3, 1, false},
			Record{3, 10, true},
		};
		auto const format4_offset = static_cast<std::uint32_t>(4 + records.size() * 8);
		auto const format12_offset = static_cast<std::uint32_t>(format4_offset + format4.size());
		auto out = ByteWriter{};
		out.append16(0); // version
		out.append16(static_cast<std::uint16_t>(records.size()));
		for (auto const& record : records) {
			out.append16(record.platform);
			out.append16(record.encoding);
			out.append32(record.format12 ? format12_offset : format4_offset);
		}
		out.append_bytes(format4);
		out.append_bytes(format12);
		return out.release();
	}

	std::vector<std::byte> write_name() const {
		auto const& names = m_tables.names;
		struct Record {
			std::uint16_t platform{};
			std::uint16_t encoding{};
			std::uint16_t language{};
			std::uint16_t name_id{};
			std::vector<std::byte> data{};
		};
		auto const strings = std::array<std::string, 6>{
			names.family, names.style, names.unique_id(), names.full_name(), names.version, names.postscript_name(),
		};
		// sorted by platform, encoding, language, name id
		auto records = std::vector<Record>{};
		for (std::size_t i = 0; i < strings.size(); ++i) {
			records.push_back(Record{1, 0, 0, static_cast<std::uint16_t>(i + 1), encode_mac_roman(strings[i])});
		}
		for (std::size_t i = 0; i < strings.size(); ++i) {
			records.push_back(Record{3, 1, 0x0409, static_cast<std::uint16_t>(i + 1), encode_utf16be(strings[i])});
		}

		auto out = ByteWriter{};
		out.append16(0); // format
		out.append16(static_cast<std::uint16_t>(records.size()));
		out.append16(static_cast<std::uint16_t>(6 + 12 * records.size()));
		auto offset = std::size_t{};
		for (auto const& record : records) {
			out.append16(record.platform);
			out.append16(record.encoding);
			out.append16(record.language);
			out.append16(record.name_id);
			out.append16(checked_cast<std::uint16_t>(record.data.size(), "name record length"));
			out.append16(checked_cast<std::uint16_t>(offset, "name storage offset"));
			offset += record.data.size();
		}
		for (auto const& record : records) { out.append_bytes(record.data); }
		return out.release();
	}

	std::vector<std::byte> write_post() const {
		auto const& post = m_tables.post;
		auto out = ByteWriter{};
		out.append32(0x00020000);
		out.append32(static_cast<std::uint32_t>(post.italic_angle));
		out.append_i16(post.underline_position);
		out.append_i16(post.underline_thickness);
		out.append32(post.is_fixed_pitch ? 1 : 0);
		out.append_zeros(16); // min/max memory
		out.append16(glyph_count());
		// .notdef is standard Macintosh glyph 0; every other name is stored after the 258 standard names
		auto custom = std::vector<std::string_view>{};
		for (auto const& name : m_tables.glyph_order) {
			if (name == GlyphIdentity::notdef_name_v) {
				out.append16(0);
				continue;
			}
			out.append16(checked_cast<std::uint16_t>(258 + custom.size(), "post glyph name index"));
			custom.push_back(name);
		}
		for (auto const name : custom) {
			if (name.size() > max_post_name_v) { throw SerializationError{fmt::format("glyph name too long for post table: {}", name)}; }
			out.append8(static_cast<std::uint8_t>(name.size()));
			for (char const c : name) { out.append8(static_cast<std::uint8_t>(c)); }
		}
		return out.release();
	}

	std::vector<std::byte> write_strike(Strike const& strike) const {
		auto const glyphs = strike.glyphs();
		auto out = ByteWriter{};
		out.append16(strike.spec().ppem);
		out.append16(strike.spec().resolution);
		auto const offsets_start = out.size();
		out.append_zeros(4 * (glyphs.size() + 1));
		for (std::size_t i = 0; i < glyphs.size(); ++i) {
			auto const& glyph = glyphs[i];
			out.overwrite32(offsets_start + 4 * i, checked_cast<std::uint32_t>(out.size(), "sbix glyph offset"));
			if (glyph.data.empty()) { continue; }
			out.append_i16(static_cast<std::int16_t>(glyph.origin.x));
			out.append_i16(static_cast<std::int16_t>(glyph.origin.y));
			out.append_tag(glyph.graphic_type);
			out.append_bytes(glyph.data);
		}
		out.overwrite32(offsets_start + 4 * glyphs.size(), checked_cast<std::uint32_t>(out.size(), "sbix glyph offset"));
		return out.release();
	}

	std::vector<std::byte> write_sbix() const {
		auto const& table = m_tables.bitmap_table;
		auto out = ByteWriter{};
		out.append16(table.version);
		out.append16(table.flags);
		out.append32(static_cast<std::uint32_t>(table.strikes.size()));
		auto const offsets_start = out.size();
		out.append_zeros(4 * table.strikes.size());
		for (std::size_t i = 0; i < table.strikes.size(); ++i) {
			out.overwrite32(offsets_start + 4 * i, checked_cast<std::uint32_t>(out.size(), "sbix strike offset"));
			out.append_bytes(write_strike(table.strikes[i]));
		}
		return out.release();
	}

	FontDocument::Tables const& m_tables;
	GlyphIds m_glyph_ids{};
	std::vector<Mapping> m_mappings{};
};

std::vector<std::byte> assemble(std::span<Table const> tables) {
	auto const num_tables = static_cast<std::uint16_t>(tables.size());
	auto const search_range = static_cast<std::uint16_t>(16u << integral_log2(num_tables));
	auto out = ByteWriter{};
	out.append32(0x00010000); // sfntVersion: TrueType outlines
	out.append16(num_tables);
	out.append16(search_range);
	out.append16(integral_log2(num_tables));
	out.append16(static_cast<std::uint16_t>(num_tables * 16 - search_range));
	assert(out.size() == header_size_v);
	out.append_zeros(directory_entry_size_v * tables.size());

	auto head_offset = std::size_t{};
	for (std::size_t i = 0; i < tables.size(); ++i) {
		auto const& table = tables[i];
		auto const offset = out.size();
		if (table.tag == "head") { head_offset = offset; }
		out.append_bytes(table.data);
		out.pad_to_4();
		auto const entry = header_size_v + i * directory_entry_size_v;
		out.overwrite32(entry, to_tag_value(table.tag));
		out.overwrite32(entry + 4, checksum(table.data));
		out.overwrite32(entry + 8, checked_cast<std::uint32_t>(offset, "table offset"));
		out.overwrite32(entry + 12, checked_cast<std::uint32_t>(table.data.size(), "table length"));
	}
	out.overwrite32(head_offset + 8, checksum_magic_v - checksum(out.bytes()));
	return out.release();
}
} // namespace

std::uint32_t checksum(std::span<std::byte const> bytes) {
	auto sum = std::uint32_t{};
	for (std::size_t offset = 0; offset < bytes.size(); offset += 4) {
		auto word = std::uint32_t{};
		for (std::size_t i = 0; i < 4; ++i) {
			word <<= 8;
			if (offset + i < bytes.size()) { word |= static_cast<std::uint32_t>(bytes[offset + i]); }
		}
		sum += word;
	}
	return sum;
}

std::vector<std::byte> serialize(FontDocument const& document) {
	auto const tables = TableWriter{document}.write_all();
	return assemble(tables);
}

void save(FontDocument const& document, std::filesystem::path const& path) { save(serialize(document), path); }

void save(std::span<std::byte const> bytes, std::filesystem::path const& path) {
	namespace fs = std::filesystem;
	auto temp_path = path;
	temp_path += ".tmp";
	auto ec = std::error_code{};
	auto fail = [&](std::string_view what) {
		fs::remove(temp_path, ec);
		throw SerializationError{fmt::format("{}: {}", what, path.generic_string())};
	};

	auto file = std::ofstream{temp_path, std::ios::binary | std::ios::trunc};
	if (!file) { fail("failed to open output file"); }
	file.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
	file.close();
	if (!file) { fail("failed to write output file"); }
	fs::rename(temp_path, path, ec);
	if (ec) { fail("failed to move output file into place"); }
}
} // namespace fontaku::sfnt
