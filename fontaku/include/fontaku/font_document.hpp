#pragma once
#include <fontaku/codepoint.hpp>
#include <fontaku/font_metrics.hpp>
#include <fontaku/strike.hpp>
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fontaku {
///
/// \brief Codepoint to glyph name, ordered by codepoint.
///
using CharacterMap = std::map<Codepoint, std::string>;

///
/// \brief Outline of one glyph. Only empty outlines (no contours) are produced.
///
struct GlyphOutline {
	std::uint16_t contour_count{};
};

struct HorizontalMetric {
	std::uint16_t advance_width{};
	std::int16_t left_side_bearing{};
};

struct HeadTable {
	std::uint16_t units_per_em{800};
	///
	/// \brief Font revision as 16.16 fixed point.
	///
	std::uint32_t font_revision{0x00010000};
	///
	/// \brief Seconds since the Unix epoch.
	///
	std::int64_t created{};
	std::int64_t modified{};
	///
	/// \brief Baseline at y=0, left sidebearing at x=0.
	///
	std::uint16_t flags{0x0003};
	std::uint16_t mac_style{};
	std::uint16_t lowest_rec_ppem{3};
	std::int16_t font_direction_hint{2};
};

struct HorizontalHeader {
	std::int16_t ascender{800};
	std::int16_t descender{-250};
	std::int16_t line_gap{};
};

struct OS2Table {
	std::uint16_t weight_class{400};
	std::uint16_t width_class{5};
	std::uint16_t fs_type{};
	///
	/// \brief REGULAR.
	///
	std::uint16_t fs_selection{0x0040};
	std::array<char, 4> vendor_id{'N', 'O', 'N', 'E'};
	std::int16_t typo_ascender{750};
	std::int16_t typo_descender{-250};
	std::int16_t typo_line_gap{};
	std::uint16_t win_ascent{};
	std::uint16_t win_descent{};
	std::int16_t x_height{500};
	std::int16_t cap_height{800};
};

struct PostTable {
	///
	/// \brief 16.16 fixed point, counter-clockwise degrees from vertical.
	///
	std::int32_t italic_angle{};
	std::int16_t underline_position{};
	std::int16_t underline_thickness{};
	bool is_fixed_pitch{};
};

///
/// \brief In-memory font: every table the sfnt writer needs, in typed form.
///
/// Constructed only through FontDocument::Builder, which fixes the order tables are supplied in
/// and rejects inconsistent input with SerializationError.
///
class FontDocument {
  public:
	class Builder;

	struct Tables {
		std::vector<std::string> glyph_order{};
		CharacterMap character_map{};
		std::vector<GlyphOutline> outlines{};
		std::vector<HorizontalMetric> horizontal_metrics{};
		HeadTable head{};
		HorizontalHeader horizontal_header{};
		OS2Table os2{};
		FontNames names{};
		PostTable post{};
		BitmapTable bitmap_table{};
	};

	Tables const& tables() const { return m_tables; }

	std::vector<std::string> const& glyph_order() const { return m_tables.glyph_order; }
	CharacterMap const& character_map() const { return m_tables.character_map; }
	BitmapTable const& bitmap_table() const { return m_tables.bitmap_table; }
	std::size_t glyph_count() const { return m_tables.glyph_order.size(); }

	///
	/// \brief Obtain the glyph index of a glyph name.
	///
	std::optional<std::uint16_t> glyph_id(std::string_view glyph_name) const;

  private:
	explicit FontDocument(Tables tables) : m_tables(std::move(tables)) {}

	Tables m_tables{};

	friend class Builder;
};

///
/// \brief Staged builder: each stage exposes only the next setter, and every setter consumes the stage.
///
/// FontDocument::Builder{}.set_glyph_order(...).set_character_map(...).set_outlines(...)
///		.set_horizontal_metrics(...).set_head(...).set_horizontal_header(...).set_os2(...)
///		.set_names(...).set_post(...).set_bitmap_table(...)
///
class FontDocument::Builder {
  public:
	class CharacterMapStage;
	class OutlineStage;
	class MetricsStage;
	class HeadStage;
	class HorizontalHeaderStage;
	class OS2Stage;
	class NameStage;
	class PostStage;
	class BitmapStage;

	///
	/// \brief Set the glyph order. The first glyph must be .notdef and names must be unique.
	///
	CharacterMapStage set_glyph_order(std::vector<std::string> glyph_order) &&;

  private:
	template <typename Stage>
	static Stage advance(Tables&& tables) {
		return Stage{std::move(tables)};
	}

	static FontDocument finish(Tables&& tables) { return FontDocument{std::move(tables)}; }

	Tables m_tables{};
};

class FontDocument::Builder::CharacterMapStage {
  public:
	///
	/// \brief Every mapped glyph must be in the glyph order; .notdef must not be mapped.
	///
	OutlineStage set_character_map(CharacterMap character_map) &&;

  private:
	explicit CharacterMapStage(Tables&& tables) : m_tables(std::move(tables)) {}
	Tables m_tables;
	friend class FontDocument::Builder;
};

class FontDocument::Builder::OutlineStage {
  public:
	///
	/// \brief One outline per glyph.
	///
	MetricsStage set_outlines(std::vector<GlyphOutline> outlines) &&;

  private:
	explicit OutlineStage(Tables&& tables) : m_tables(std::move(tables)) {}
	Tables m_tables;
	friend class FontDocument::Builder;
};

class FontDocument::Builder::MetricsStage {
  public:
	///
	/// \brief One metric per glyph.
	///
	HeadStage set_horizontal_metrics(std::vector<HorizontalMetric> metrics) &&;

  private:
	explicit MetricsStage(Tables&& tables) : m_tables(std::move(tables)) {}
	Tables m_tables;
	friend class FontDocument::Builder;
};

class FontDocument::Builder::HeadStage {
  public:
	HorizontalHeaderStage set_head(HeadTable head) &&;

  private:
	explicit HeadStage(Tables&& tables) : m_tables(std::move(tables)) {}
	Tables m_tables;
	friend class FontDocument::Builder;
};

class FontDocument::Builder::HorizontalHeaderStage {
  public:
	OS2Stage set_horizontal_header(HorizontalHeader horizontal_header) &&;

  private:
	explicit HorizontalHeaderStage(Tables&& tables) : m_tables(std::move(tables)) {}
	Tables m_tables;
	friend class FontDocument::Builder;
};

class FontDocument::Builder::OS2Stage {
  public:
	NameStage set_os2(OS2Table os2) &&;

  private:
	explicit OS2Stage(Tables&& tables) : m_tables(std::move(tables)) {}
	Tables m_tables;
	friend class FontDocument::Builder;
};

class FontDocument::Builder::NameStage {
  public:
	PostStage set_names(FontNames names) &&;

  private:
	explicit NameStage(Tables&& tables) : m_tables(std::move(tables)) {}
	Tables m_tables;
	friend class FontDocument::Builder;
};

class FontDocument::Builder::PostStage {
  public:
	BitmapStage set_post(PostTable post) &&;

  private:
	explicit PostStage(Tables&& tables) : m_tables(std::move(tables)) {}
	Tables m_tables;
	friend class FontDocument::Builder;
};

class FontDocument::Builder::BitmapStage {
  public:
	///
	/// \brief Attach strikes and complete the document.
	///
	/// Strikes must be in strictly increasing ppem order and each must hold exactly one entry per glyph, in glyph order.
	///
	FontDocument set_bitmap_table(BitmapTable bitmap_table) &&;

  private:
	explicit BitmapStage(Tables&& tables) : m_tables(std::move(tables)) {}
	Tables m_tables;
	friend class FontDocument::Builder;
};
} // namespace fontaku
