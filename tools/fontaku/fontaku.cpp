#include <fmt/format.h>
#include <fontaku/build_config.hpp>
#include <fontaku/error.hpp>
#include <fontaku/font_generator.hpp>
#include <fontaku/image_transformer.hpp>
#include <fontaku/util/cli_args.hpp>
#include <fontaku/util/logger.hpp>
#include <cstdio>
#include <filesystem>
#include <optional>

namespace fs = std::filesystem;
namespace cli_args = fontaku::cli_args;

namespace fontaku::cli {
namespace {
constexpr std::string_view version_v{"1.0.0"};

struct Args {
	struct Parser;

	std::optional<fs::path> config{};
	std::optional<fs::path> input{};
	std::optional<fs::path> output{};
	std::optional<AllocationMode> mode{};
	std::optional<Codepoint> base{};
	std::optional<std::vector<std::int64_t>> strikes{};
	std::optional<std::string> family{};
	std::optional<std::int64_t> timestamp{};
	std::optional<std::uint32_t> jobs{};
	std::optional<fs::path> log_file{};
	bool verify{};
	bool verbose{};

	BuildConfig make_config() const {
		auto ret = config ? BuildConfig::from_file(*config) : BuildConfig{};
		if (input) { ret.input = *input; }
		if (output) { ret.output = *output; }
		if (mode) { ret.mode = *mode; }
		if (base) { ret.base = *base; }
		if (strikes) { ret.strikes = *strikes; }
		if (family) { ret.names.family = *family; }
		if (timestamp) { ret.timestamp = *timestamp; }
		if (jobs) { ret.jobs = *jobs; }
		ret.verify = ret.verify || verify;
		return ret;
	}
};

struct Args::Parser : cli_args::Parser {
	Args args;

	bool option(cli_args::Key key, cli_args::Value value) override {
		switch (key.single) {
		case '\0':
		default: break;
		case 'v': args.verbose = true; return true;
		case 'o': args.output = value; return true;
		case 'j': return parse_jobs(value);
		}

		if (key.full == "output") {
			args.output = value;
		} else if (key.full == "config") {
			args.config = value;
		} else if (key.full == "mode") {
			args.mode = parse_allocation_mode(value);
		} else if (key.full == "base") {
			args.base = parse_codepoint_value(value);
		} else if (key.full == "strikes") {
			args.strikes = parse_strike_list(value);
		} else if (key.full == "family") {
			if (value.empty()) { throw ConfigError{"--family requires a value"}; }
			args.family = std::string{value};
		} else if (key.full == "timestamp") {
			auto& timestamp = args.timestamp.emplace();
			if (!cli_args::as(timestamp, value)) { throw ConfigError{fmt::format("invalid timestamp: '{}'", value)}; }
		} else if (key.full == "jobs") {
			return parse_jobs(value);
		} else if (key.full == "verify") {
			args.verify = true;
		} else if (key.full == "log-file") {
			args.log_file = value.empty() ? fs::path{"fontaku.log"} : fs::path{value};
		} else if (key.full == "verbose") {
			args.verbose = true;
		} else {
			return false;
		}

		return true;
	}

	bool arguments(std::span<char const* const> in) override {
		if (in.size() > 1) {
			std::fprintf(stderr, "%s", fmt::format("unexpected argument: {}\n", in[1]).c_str());
			return false;
		}
		if (!in.empty()) { args.input = in.front(); }
		return true;
	}

	bool parse_jobs(std::string_view value) {
		auto& jobs = args.jobs.emplace();
		if (!cli_args::as(jobs, value) || jobs == 0) { throw ConfigError{fmt::format("invalid job count: '{}'", value)}; }
		return true;
	}
};

class LoggingObserver : public BuildObserver {
  public:
	explicit LoggingObserver(bool verbose) {
		if (!verbose) { m_glyph_logger.silence_above(Logger::Level::eWarn); }
	}

  private:
	void on_stage(std::string_view stage) final { m_logger.debug("stage: {}", stage); }

	void on_strike_begin(StrikeSpec const& spec, std::size_t glyph_count) final {
		m_logger.info("building strike {} ({} glyphs)", spec.ppem, glyph_count);
	}

	void on_glyph(StrikeSpec const& spec, GlyphIdentity const& glyph, RenderedBitmap const& bitmap) final {
		m_glyph_logger.info("[{}] {} {}: {}x{} at ({}, {}), {} bytes", spec.ppem, to_string(glyph.codepoint), glyph.name, bitmap.placement.size.x,
							bitmap.placement.size.y, bitmap.placement.offset.x, bitmap.placement.offset.y, bitmap.png.size());
	}

	void on_strike_end(Strike const& strike) final { m_logger.debug("strike {} complete", strike.spec().ppem); }

	Logger m_logger{"fontaku"};
	Logger m_glyph_logger{"glyph"};
};

struct App {
	Args args{};
	std::optional<Logger::Instance> log_instance{};

	bool run(std::span<char const* const> in) {
		auto parser = Args::Parser{};

		auto spec = cli_args::Spec{};
		spec.app_name = "fontaku";
		spec.version = version_v;
		spec.options = {
			cli_args::Opt{cli_args::Key{"output", 'o'}, "path.ttf", false, "output font file (default: Fontaku.ttf)"},
			cli_args::Opt{cli_args::Key{"config"}, "path.json", false, "JSON config file (options override it)"},
			cli_args::Opt{cli_args::Key{"mode"}, "standard|legacy", false, "codepoint allocation mode (default: standard)"},
			cli_args::Opt{cli_args::Key{"base"}, "U+XXXX", false, "first codepoint in standard mode (default: U+1F600)"},
			cli_args::Opt{cli_args::Key{"strikes"}, "32,64,...", false, "bitmap strike sizes in pixels per em"},
			cli_args::Opt{cli_args::Key{"family"}, "name", false, "font family name"},
			cli_args::Opt{cli_args::Key{"timestamp"}, "seconds", false, "fixed creation time (Unix seconds) for reproducible output"},
			cli_args::Opt{cli_args::Key{"jobs", 'j'}, "count", false, "number of strikes to build concurrently"},
			cli_args::Opt{cli_args::Key{"verify"}, {}, true, "reload the font through FreeType and check it"},
			cli_args::Opt{cli_args::Key{"log-file"}, "path", true, "mirror log output to a file"},
			cli_args::Opt{cli_args::Key{"verbose", 'v'}, {}, true, "log every glyph"},
		};
		spec.arguments = "[input-dir]";

		switch (cli_args::parse(spec, &parser, in)) {
		case cli_args::Result::eExitSuccess: return true;
		case cli_args::Result::eExitFailure: return false;
		default: break;
		}

		args = std::move(parser.args);
		if (args.log_file) { log_instance.emplace(args.log_file->string().c_str()); }

		auto const config = args.make_config();
		auto observer = LoggingObserver{args.verbose};
		auto const generator = FontGenerator{{.observer = &observer}};
		g_logger.info("generating {} from {} ({} mode)", config.output.generic_string(), config.input.generic_string(), allocation_mode_names_v[config.mode]);
		auto const result = generator.generate(config);
		g_logger.info("[{}] {} glyphs, {} strikes, {} bytes", result.path.generic_string(), result.glyph_count, result.strike_count, result.byte_count);
		return true;
	}
};
} // namespace
} // namespace fontaku::cli

int main(int argc, char** argv) {
	using fontaku::g_logger;
	auto app = fontaku::cli::App{};
	try {
		if (!app.run({argv + 1, static_cast<std::size_t>(argc - 1)})) { return EXIT_FAILURE; }
	} catch (fontaku::Error const& e) {
		g_logger.error("{}", e.what());
		return EXIT_FAILURE;
	} catch (std::exception const& e) {
		g_logger.error("unexpected error: {}", e.what());
		return EXIT_FAILURE;
	}
}
