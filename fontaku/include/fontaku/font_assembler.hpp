#pragma once
#include <fontaku/build_observer.hpp>
#include <fontaku/codepoint_allocator.hpp>
#include <fontaku/font_document.hpp>
#include <fontaku/font_metrics.hpp>
#include <fontaku/util/clock.hpp>
#include <fontaku/util/ptr.hpp>
#include <span>

namespace fontaku {
class ThreadPool;

///
/// \brief Turns allocated glyphs and strike specs into a complete FontDocument.
///
class FontAssembler {
  public:
	struct CreateInfo {
		FontMetrics metrics{};
		FontNames names{};
		///
		/// \brief Source of head.created / head.modified (system clock if null).
		///
		Ptr<Clock const> clock{};
		///
		/// \brief Optional progress observer (must outlive the assembler).
		///
		Ptr<BuildObserver> observer{};
		///
		/// \brief Optional pool to build strikes on (sequential if null).
		///
		Ptr<ThreadPool> thread_pool{};
	};

	explicit FontAssembler(CreateInfo create_info = {}) : m_info(std::move(create_info)) {}

	///
	/// \brief Assemble every table and one strike per spec.
	/// \param allocation Allocated glyphs (excluding .notdef)
	/// \param strike_specs Strikes in strictly increasing ppem order
	///
	/// Any failure propagates; a partial document is never returned.
	///
	FontDocument assemble(Allocation const& allocation, std::span<StrikeSpec const> strike_specs) const;

  private:
	BitmapTable build_strikes(Allocation const& allocation, std::span<StrikeSpec const> strike_specs) const;

	CreateInfo m_info{};
};
} // namespace fontaku
