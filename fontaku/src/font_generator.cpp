#include <fmt/format.h>
#include <fontaku/codepoint_allocator.hpp>
#include <fontaku/error.hpp>
#include <fontaku/font_assembler.hpp>
#include <fontaku/font_generator.hpp>
#include <fontaku/sfnt/writer.hpp>
#include <fontaku/source_scanner.hpp>
#include <fontaku/util/thread_pool.hpp>
#include <optional>

namespace fontaku {
namespace {
void notify_stage(Ptr<BuildObserver> observer, std::string_view const stage) {
	if (observer) { observer->on_stage(stage); }
}
} // namespace

void verify_report(FontDocument const& document, FontReport const& report) {
	if (report.glyph_count != document.glyph_count()) {
		throw SerializationError{fmt::format("verify: glyph count {} != {}", report.glyph_count, document.glyph_count())};
	}
	if (report.family != document.tables().names.family) {
		throw SerializationError{fmt::format("verify: family '{}' != '{}'", report.family, document.tables().names.family)};
	}
	if (!report.glyph_names.empty() && report.glyph_names != document.glyph_order()) { throw SerializationError{"verify: glyph names differ"}; }

	auto const& character_map = document.character_map();
	if (report.mappings.size() != character_map.size()) {
		throw SerializationError{fmt::format("verify: {} mapped codepoints != {}", report.mappings.size(), character_map.size())};
	}
	for (auto const& [codepoint, name] : character_map) {
		auto const it = report.mappings.find(codepoint);
		auto const expected = document.glyph_id(name);
		if (it == report.mappings.end() || !expected || it->second != *expected) {
			throw SerializationError{fmt::format("verify: {} is not mapped to {}", to_string(codepoint), name)};
		}
	}

	auto const& strikes = document.bitmap_table().strikes;
	if (report.strike_ppems.size() != strikes.size()) {
		throw SerializationError{fmt::format("verify: strike count {} != {}", report.strike_ppems.size(), strikes.size())};
	}
	for (std::size_t i = 0; i < strikes.size(); ++i) {
		if (report.strike_ppems[i] != strikes[i].spec().ppem) {
			throw SerializationError{fmt::format("verify: strike {} ppem {} != {}", i, report.strike_ppems[i], strikes[i].spec().ppem)};
		}
	}
}

void FreetypeVerifier::verify(FontDocument const& document, std::span<std::byte const> bytes) const { verify_report(document, FontInspector{}.inspect(bytes)); }

FontGenerator::Result FontGenerator::generate(BuildConfig const& config) const {
	auto const strike_specs = make_strike_specs(config.strikes, config.resolution);

	notify_stage(m_info.observer, "scan");
	auto images = scan_directory(config.input, config.mode);

	notify_stage(m_info.observer, "allocate");
	auto const allocation = CodepointAllocator::make(config.mode, config.base)->allocate(std::move(images));

	auto fixed_clock = std::optional<Clock::Fixed>{};
	if (config.timestamp) { fixed_clock.emplace(Clock::Fixed::from_unix(*config.timestamp)); }
	auto thread_pool = std::optional<ThreadPool>{};
	if (config.jobs > 1 && strike_specs.size() > 1) { thread_pool.emplace(config.jobs); }

	auto const assembler = FontAssembler{{
		.names = config.names,
		.clock = fixed_clock ? &*fixed_clock : m_info.clock,
		.observer = m_info.observer,
		.thread_pool = thread_pool ? &*thread_pool : nullptr,
	}};
	auto const document = assembler.assemble(allocation, strike_specs);

	notify_stage(m_info.observer, "serialize");
	auto const bytes = sfnt::serialize(document);

	if (config.verify) {
		notify_stage(m_info.observer, "verify");
		if (m_info.verifier) {
			m_info.verifier->verify(document, bytes);
		} else {
			FreetypeVerifier{}.verify(document, bytes);
		}
	}

	notify_stage(m_info.observer, "save");
	sfnt::save(bytes, config.output);

	return Result{
		.path = config.output,
		.glyph_count = document.glyph_count(),
		.strike_count = document.bitmap_table().strikes.size(),
		.byte_count = bytes.size(),
	};
}
} // namespace fontaku
