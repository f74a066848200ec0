#include <fmt/format.h>
#include <fontaku/util/cli_args.hpp>
#include <algorithm>
#include <cstdio>
#include <iterator>
#include <string>

namespace fontaku {
namespace {
using cli_args::Result;

void print_error(std::string const& text) { std::fprintf(stderr, "%s", text.c_str()); }

class OptionParser {
  public:
	OptionParser(cli_args::Spec spec, Ptr<cli_args::Parser> out) : m_spec(std::move(spec)), m_out(out) {
		if (m_spec.app_name.empty()) { m_spec.app_name = "fontaku"; }
		if (m_spec.version.empty()) { m_spec.version = "(unknown)"; }
		std::erase_if(m_spec.options, [](cli_args::Opt const& o) { return !o.key.valid(); });
		m_spec.options.push_back(cli_args::Opt{.key = {.full = "help"}, .help = "Show this help text"});
		m_spec.options.push_back(cli_args::Opt{.key = {.full = "version"}, .help = "Display the version"});
	}

	Result parse(std::span<char const* const> args) const {
		for (; !args.empty(); args = args.subspan(1)) {
			auto const arg = std::string_view{args.front()};
			if (arg == "--") {
				args = args.subspan(1);
				break;
			}
			if (arg.size() < 2 || arg[0] != '-') { break; }
			auto const result = arg[1] == '-' ? parse_full(arg.substr(2)) : parse_singles(arg.substr(1));
			if (result != Result::eContinue) { return result; }
		}
		if (m_out && !m_out->arguments(args)) { return Result::eExitFailure; }
		return Result::eContinue;
	}

  private:
	cli_args::Opt const* find(std::string_view const full) const {
		auto const it = std::ranges::find_if(m_spec.options, [full](cli_args::Opt const& opt) { return opt.key.full == full; });
		return it == m_spec.options.end() ? nullptr : &*it;
	}

	cli_args::Opt const* find(char const single) const {
		auto const it = std::ranges::find_if(m_spec.options, [single](cli_args::Opt const& opt) { return opt.key.single == single; });
		return it == m_spec.options.end() ? nullptr : &*it;
	}

	// --key or --key=value
	Result parse_full(std::string_view const word) const {
		auto const eq = word.find('=');
		auto const key = word.substr(0, eq);
		auto const* opt = key.empty() ? nullptr : find(key);
		if (!opt) { return unknown_option(fmt::format("--{}", key)); }
		return dispatch(*opt, eq == std::string_view::npos ? cli_args::Value{} : word.substr(eq + 1));
	}

	// -vf, -o=out.ttf
	Result parse_singles(std::string_view letters) const {
		while (!letters.empty()) {
			auto const single = letters.front();
			letters = letters.substr(1);
			auto const* opt = find(single);
			if (!opt) { return unknown_option(fmt::format("-{}", single)); }
			if (!letters.empty() && letters.front() == '=') { return dispatch(*opt, letters.substr(1)); }
			if (auto const result = dispatch(*opt, {}); result != Result::eContinue) { return result; }
		}
		return Result::eContinue;
	}

	Result dispatch(cli_args::Opt const& opt, cli_args::Value const value) const {
		if (!opt.value.empty() && !opt.is_optional_value && value.empty()) {
			auto const name = opt.key.full.empty() ? fmt::format("-{}", opt.key.single) : fmt::format("--{}", opt.key.full);
			print_error(fmt::format("missing required value for option: {}\n", name));
			return Result::eExitFailure;
		}
		if (opt.key.full == "help") { return print_help(); }
		if (opt.key.full == "version") { return print_version(); }
		if (m_out && !m_out->option(opt.key, value)) { return Result::eExitFailure; }
		return Result::eContinue;
	}

	Result unknown_option(std::string const& name) const {
		print_error(fmt::format("unknown option: {}\nTry '{} --help' for more information.\n", name, m_spec.app_name));
		return Result::eExitFailure;
	}

	static std::string describe(cli_args::Opt const& opt) {
		auto ret = std::string{"  "};
		ret += opt.key.single ? fmt::format("-{}", opt.key.single) : std::string{"  "};
		if (!opt.key.full.empty()) { ret += fmt::format("{} --{}", opt.key.single ? ',' : ' ', opt.key.full); }
		if (!opt.value.empty()) { ret += opt.is_optional_value ? fmt::format("[={}]", opt.value) : fmt::format("={}", opt.value); }
		return ret;
	}

	Result print_help() const {
		auto str = fmt::format("Usage: {} [OPTION]... {}\n\n", m_spec.app_name, m_spec.arguments);
		auto width = std::size_t{};
		for (auto const& opt : m_spec.options) { width = std::max(width, describe(opt).size()); }
		auto it = std::back_inserter(str);
		for (auto const& opt : m_spec.options) { fmt::format_to(it, "{:<{}}    {}\n", describe(opt), width, opt.help); }
		std::fprintf(stdout, "%s\n", str.c_str());
		return Result::eExitSuccess;
	}

	Result print_version() const {
		std::fprintf(stdout, "%s", fmt::format("{} version {}\n", m_spec.app_name, m_spec.version).c_str());
		return Result::eExitSuccess;
	}

	cli_args::Spec m_spec{};
	Ptr<cli_args::Parser> m_out{};
};
} // namespace

auto cli_args::parse(Spec spec, Ptr<Parser> out, std::span<char const* const> args) -> Result { return OptionParser{std::move(spec), out}.parse(args); }
} // namespace fontaku
