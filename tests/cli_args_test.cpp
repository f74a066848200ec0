#include <fontaku/util/cli_args.hpp>
#include <test/test.hpp>
#include <array>
#include <string>
#include <vector>

namespace {
using namespace fontaku;

struct Recorder : cli_args::Parser {
	std::vector<std::pair<std::string, std::string>> options{};
	std::vector<std::string> arguments_received{};

	bool option(cli_args::Key key, cli_args::Value value) override {
		if (key.full == "reject") { return false; }
		options.emplace_back(key.full.empty() ? std::string{key.single} : std::string{key.full}, std::string{value});
		return true;
	}

	bool arguments(std::span<char const* const> args) override {
		for (auto const* arg : args) { arguments_received.emplace_back(arg); }
		return true;
	}
};

cli_args::Spec make_spec() {
	auto ret = cli_args::Spec{};
	ret.app_name = "test";
	ret.options = {
		cli_args::Opt{cli_args::Key{"output", 'o'}, "path", false, "output"},
		cli_args::Opt{cli_args::Key{"verbose", 'v'}, {}, true, "verbose"},
		cli_args::Opt{cli_args::Key{"force", 'f'}, {}, true, "force"},
		cli_args::Opt{cli_args::Key{"log-file"}, "path", true, "log file"},
		cli_args::Opt{cli_args::Key{"reject"}, {}, true, "always rejected"},
	};
	return ret;
}

template <std::size_t N>
cli_args::Result parse(Recorder& recorder, std::array<char const*, N> const& args) {
	return cli_args::parse(make_spec(), &recorder, args);
}

ADD_TEST(CliParseOptions) {
	auto recorder = Recorder{};
	auto const result = parse(recorder, std::array{"--output=a.ttf", "-vf", "--log-file", "images"});
	EXPECT(result == cli_args::Result::eContinue);
	ASSERT(recorder.options.size() == 4u);
	EXPECT(recorder.options[0] == std::pair<std::string, std::string>{"output", "a.ttf"});
	EXPECT(recorder.options[1].first == "verbose");
	EXPECT(recorder.options[2].first == "force");
	EXPECT(recorder.options[3] == std::pair<std::string, std::string>{"log-file", ""});
	ASSERT(recorder.arguments_received.size() == 1u);
	EXPECT(recorder.arguments_received[0] == "images");
}

ADD_TEST(CliParseSingleWithValue) {
	auto recorder = Recorder{};
	EXPECT(parse(recorder, std::array{"-o=b.ttf"}) == cli_args::Result::eContinue);
	ASSERT(recorder.options.size() == 1u);
	EXPECT(recorder.options[0].second == "b.ttf");
	EXPECT(recorder.arguments_received.empty());
}

ADD_TEST(CliParseTerminator) {
	auto recorder = Recorder{};
	EXPECT(parse(recorder, std::array{"-v", "--", "-not-an-option"}) == cli_args::Result::eContinue);
	EXPECT(recorder.options.size() == 1u);
	ASSERT(recorder.arguments_received.size() == 1u);
	EXPECT(recorder.arguments_received[0] == "-not-an-option");
}

ADD_TEST(CliParseFailures) {
	auto recorder = Recorder{};
	EXPECT(parse(recorder, std::array{"--unknown"}) == cli_args::Result::eExitFailure);
	EXPECT(parse(recorder, std::array{"-x"}) == cli_args::Result::eExitFailure);
	EXPECT(parse(recorder, std::array{"--output"}) == cli_args::Result::eExitFailure);
	EXPECT(parse(recorder, std::array{"--reject"}) == cli_args::Result::eExitFailure);
}

ADD_TEST(CliParseBuiltins) {
	auto recorder = Recorder{};
	EXPECT(parse(recorder, std::array{"--version"}) == cli_args::Result::eExitSuccess);
	EXPECT(parse(recorder, std::array{"--help"}) == cli_args::Result::eExitSuccess);
	EXPECT(recorder.options.empty());
}

ADD_TEST(CliIntegralValues) {
	auto value = int{};
	EXPECT(cli_args::as(value, "42") && value == 42);
	EXPECT(cli_args::as(value, "0x1F") && value == 31);
	EXPECT(cli_args::as(value, "-3") && value == -3);
	EXPECT(!cli_args::as(value, "4x"));
	EXPECT(!cli_args::as(value, ""));
	EXPECT(!cli_args::as(value, "0x"));
	auto small = std::uint8_t{};
	EXPECT(!cli_args::as(small, "300"));
}
} // namespace
