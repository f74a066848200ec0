#pragma once
#include <fontaku/allocation_mode.hpp>
#include <fontaku/codepoint.hpp>
#include <fontaku/source_image.hpp>
#include <memory>
#include <span>
#include <vector>

namespace fontaku {
///
/// \brief A source image paired with its assigned identity.
///
struct AllocatedGlyph {
	GlyphIdentity identity{};
	SourceImage source;
};

///
/// \brief Result of codepoint allocation.
///
/// glyphs is in allocation order: codepoints strictly increase and names are unique.
/// The reserved .notdef glyph is implicit at glyph index 0 and is not part of glyphs.
///
struct Allocation {
	std::vector<AllocatedGlyph> glyphs{};

	///
	/// \brief Total number of glyphs in the font, including .notdef.
	///
	std::size_t glyph_count() const { return glyphs.size() + 1; }

	///
	/// \brief Identities in glyph order, starting with .notdef.
	///
	std::vector<GlyphIdentity> glyph_order() const;
};

///
/// \brief Assigns codepoints and glyph names to an ordered list of source images.
///
class CodepointAllocator {
  public:
	struct Sequential;
	struct Filename;

	virtual ~CodepointAllocator() = default;

	///
	/// \brief Create the allocator for a mode.
	/// \param mode Allocation mode
	/// \param base First codepoint (eStandard only)
	///
	static std::unique_ptr<CodepointAllocator> make(AllocationMode mode, Codepoint base = Codepoint::eDefaultBase);

	///
	/// \brief Allocate identities for images.
	///
	/// Throws EmptyInputError if images is empty, InvalidCodepointError if a codepoint cannot be assigned.
	///
	virtual Allocation allocate(std::vector<SourceImage> images) const = 0;
};

///
/// \brief Assigns base + i to the i-th image, in the order given.
///
struct CodepointAllocator::Sequential : CodepointAllocator {
	Codepoint base{Codepoint::eDefaultBase};

	explicit Sequential(Codepoint base = Codepoint::eDefaultBase) : base(base) {}

	Allocation allocate(std::vector<SourceImage> images) const final;
};

///
/// \brief Parses each codepoint from a U+<hex> file stem and orders images by codepoint.
///
struct CodepointAllocator::Filename : CodepointAllocator {
	///
	/// \brief Extract the codepoint from a file stem.
	///
	/// Throws InvalidCodepointError if stem is not U+<hex> or the value is not mappable.
	///
	static Codepoint parse_stem(std::string_view stem);

	Allocation allocate(std::vector<SourceImage> images) const final;
};
} // namespace fontaku
