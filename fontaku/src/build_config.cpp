#include <djson/json.hpp>
#include <fmt/format.h>
#include <fontaku/build_config.hpp>
#include <fontaku/error.hpp>
#include <fontaku/util/cli_args.hpp>
#include <limits>

namespace fontaku {
namespace {
std::string_view trim(std::string_view text) {
	while (!text.empty() && text.front() == ' ') { text = text.substr(1); }
	while (!text.empty() && text.back() == ' ') { text = text.substr(0, text.size() - 1); }
	return text;
}

std::int64_t to_integer(dj::Json const& json, std::string_view key) {
	if (!json.is_number()) { throw ConfigError{fmt::format("'{}' must be a number", key)}; }
	return json.as<std::int64_t>();
}

std::string to_text(dj::Json const& json, std::string_view key) {
	auto ret = json.as<std::string>();
	if (ret.empty()) { throw ConfigError{fmt::format("'{}' must be a non-empty string", key)}; }
	return ret;
}

Codepoint to_codepoint(std::int64_t const value) {
	if (value <= 0 || value > to_u32(Codepoint::eMax)) { throw ConfigError{fmt::format("codepoint out of range: {}", value)}; }
	auto const ret = Codepoint{static_cast<std::uint32_t>(value)};
	if (!is_mappable(ret)) { throw ConfigError{fmt::format("{} cannot be mapped", to_string(ret))}; }
	return ret;
}
} // namespace

Codepoint parse_codepoint_value(std::string_view text) {
	text = trim(text);
	auto value = std::int64_t{};
	if (text.size() > 2 && (text[0] == 'U' || text[0] == 'u') && text[1] == '+') {
		auto const ret = parse_hex(text.substr(2));
		if (!ret) { throw ConfigError{fmt::format("invalid codepoint: {}", text)}; }
		value = to_u32(*ret);
	} else if (!cli_args::as(value, text)) {
		throw ConfigError{fmt::format("invalid codepoint: {}", text)};
	}
	return to_codepoint(value);
}

std::vector<std::int64_t> parse_strike_list(std::string_view text) {
	auto ret = std::vector<std::int64_t>{};
	while (!text.empty()) {
		auto const comma = text.find(',');
		auto const element = trim(text.substr(0, comma));
		auto& value = ret.emplace_back();
		if (!cli_args::as(value, element)) { throw ConfigError{fmt::format("invalid strike size: '{}'", element)}; }
		if (comma == std::string_view::npos) { break; }
		text = text.substr(comma + 1);
	}
	if (ret.empty()) { throw ConfigError{"empty strike list"}; }
	return ret;
}

AllocationMode parse_allocation_mode(std::string_view const text) {
	if (auto const ret = to_allocation_mode(text)) { return *ret; }
	throw ConfigError{fmt::format("unknown mode: '{}' (expected standard or legacy)", text)};
}

void BuildConfig::apply(dj::Json const& json) {
	if (json.contains("input")) { input = to_text(json["input"], "input"); }
	if (json.contains("output")) { output = to_text(json["output"], "output"); }
	if (json.contains("mode")) { mode = parse_allocation_mode(json["mode"].as_string()); }
	if (json.contains("base_codepoint")) {
		auto const& in_base = json["base_codepoint"];
		base = in_base.is_number() ? to_codepoint(in_base.as<std::int64_t>()) : parse_codepoint_value(in_base.as_string());
	}
	if (json.contains("strikes")) {
		strikes.clear();
		for (auto const& in_strike : json["strikes"].array_view()) { strikes.push_back(to_integer(in_strike, "strikes")); }
	}
	if (json.contains("resolution")) { resolution = to_integer(json["resolution"], "resolution"); }
	if (json.contains("family")) { names.family = to_text(json["family"], "family"); }
	if (json.contains("style")) { names.style = to_text(json["style"], "style"); }
	if (json.contains("version")) { names.version = to_text(json["version"], "version"); }
	if (json.contains("timestamp")) { timestamp = to_integer(json["timestamp"], "timestamp"); }
	if (json.contains("jobs")) {
		auto const in_jobs = to_integer(json["jobs"], "jobs");
		if (in_jobs <= 0 || in_jobs > std::numeric_limits<std::uint16_t>::max()) { throw ConfigError{fmt::format("invalid jobs: {}", in_jobs)}; }
		jobs = static_cast<std::uint32_t>(in_jobs);
	}
}

BuildConfig BuildConfig::from_file(std::filesystem::path const& path) {
	auto const json = dj::Json::from_file(path.string().c_str());
	if (!json) { throw ConfigError{fmt::format("failed to read config file: {}", path.generic_string())}; }
	auto ret = BuildConfig{};
	ret.apply(json);
	return ret;
}

BuildConfig BuildConfig::parse(std::string_view const json_text) {
	auto const json = dj::Json::parse(json_text);
	if (!json) { throw ConfigError{"failed to parse config JSON"}; }
	auto ret = BuildConfig{};
	ret.apply(json);
	return ret;
}
} // namespace fontaku
