#pragma once
#include <fontaku/codepoint.hpp>
#include <fontaku/strike.hpp>
#include <string_view>

namespace fontaku {
struct RenderedBitmap;

///
/// \brief Receives progress notifications while a font is assembled.
///
/// When strikes are built in parallel, strike and glyph callbacks may arrive concurrently from worker threads.
///
class BuildObserver {
  public:
	virtual ~BuildObserver() = default;

	virtual void on_stage(std::string_view stage) = 0;
	virtual void on_strike_begin(StrikeSpec const& spec, std::size_t glyph_count) = 0;
	virtual void on_glyph(StrikeSpec const& spec, GlyphIdentity const& glyph, RenderedBitmap const& bitmap) = 0;
	virtual void on_strike_end(Strike const& strike) = 0;
};
} // namespace fontaku
