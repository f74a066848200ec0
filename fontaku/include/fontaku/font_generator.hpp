#pragma once
#include <fontaku/build_config.hpp>
#include <fontaku/build_observer.hpp>
#include <fontaku/font_document.hpp>
#include <fontaku/font_inspector.hpp>
#include <fontaku/util/clock.hpp>
#include <fontaku/util/ptr.hpp>
#include <cstddef>
#include <filesystem>
#include <span>

namespace fontaku {
///
/// \brief Compare what FreeType sees in a font against the document it was written from.
///
/// Throws SerializationError describing the first mismatch.
///
void verify_report(FontDocument const& document, FontReport const& report);

///
/// \brief Checks serialized font bytes against their document before they are saved.
///
struct FontVerifier {
	virtual ~FontVerifier() = default;

	///
	/// \brief Throws SerializationError if bytes do not describe document.
	///
	virtual void verify(FontDocument const& document, std::span<std::byte const> bytes) const = 0;
};

///
/// \brief Reloads the bytes through FontInspector (FreeType) and compares with verify_report().
///
struct FreetypeVerifier : FontVerifier {
	void verify(FontDocument const& document, std::span<std::byte const> bytes) const override;
};

///
/// \brief End to end pipeline: directory of images to font file.
///
class FontGenerator {
  public:
	struct CreateInfo {
		///
		/// \brief Timestamp source when the config has none (system clock if null).
		///
		Ptr<Clock const> clock{};
		Ptr<BuildObserver> observer{};
		///
		/// \brief Used when the config requests verification (FreetypeVerifier if null).
		///
		Ptr<FontVerifier const> verifier{};
	};

	struct Result {
		std::filesystem::path path{};
		std::size_t glyph_count{};
		std::size_t strike_count{};
		std::size_t byte_count{};
	};

	explicit FontGenerator(CreateInfo create_info = {}) : m_info(create_info) {}

	///
	/// \brief Generate a font from config.
	///
	/// Strike sizes are validated before any image is read. The output file is written only once
	/// the document is complete, serialized and (if requested) verified.
	///
	Result generate(BuildConfig const& config) const;

  private:
	CreateInfo m_info{};
};
} // namespace fontaku
