#pragma once
#include <fontaku/build_observer.hpp>
#include <fontaku/codepoint_allocator.hpp>
#include <fontaku/font_metrics.hpp>
#include <fontaku/strike.hpp>

namespace fontaku {
///
/// \brief Origin offset that places a bitmap's bottom edge on the descender line.
///
/// x is 0 (bitmaps are already centered horizontally); y is -descender_depth / (units_per_em / ppem), truncated toward zero.
///
OriginOffset compute_origin_offset(FontMetrics const& metrics, std::uint16_t ppem);

///
/// \brief Renders every allocated glyph at one strike size.
///
class StrikeBuilder {
  public:
	struct CreateInfo {
		FontMetrics metrics{};
		///
		/// \brief Optional progress observer (must outlive the builder).
		///
		Ptr<BuildObserver> observer{};
	};

	explicit StrikeBuilder(CreateInfo create_info = {}) : m_info(create_info) {}

	///
	/// \brief Build a strike covering .notdef and every glyph in allocation.
	///
	/// .notdef gets an empty payload and zero offsets. Any transform failure propagates; no partial strike is returned.
	///
	Strike build(Allocation const& allocation, StrikeSpec const& spec) const;

  private:
	CreateInfo m_info{};
};
} // namespace fontaku
