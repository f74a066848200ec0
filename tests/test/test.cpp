#include <fmt/format.h>
#include <test/test.hpp>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <vector>

namespace test {
namespace {
struct Assert {};

void print_failure(std::string_view type, std::string_view expr, std::source_location const& sl) {
	auto const text = fmt::format("  {} failed: '{}' [{}:{}]\n", type, expr, std::filesystem::path{sl.file_name()}.filename().string(), sl.line());
	std::fprintf(stderr, "%s", text.c_str());
}

bool g_failed{}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void set_failure(std::string_view type, std::string_view expr, std::source_location const& sl) {
	print_failure(type, expr, sl);
	g_failed = true;
}

std::vector<Test*>& get_tests() {
	static auto ret = std::vector<Test*>{};
	return ret;
}
} // namespace

Test::Test() { get_tests().push_back(this); }

void Test::do_expect(bool pred, std::string_view expr, std::source_location const& location) {
	if (pred) { return; }
	set_failure("expectation", expr, location);
}

void Test::do_assert(bool pred, std::string_view expr, std::source_location const& location) {
	if (pred) { return; }
	set_failure("assertion", expr, location);
	throw Assert{};
}

bool run_test(Test& test) {
	g_failed = {};
	try {
		test.run();
	} catch (Assert const&) {
		g_failed = true;
	} catch (std::exception const& e) {
		std::fprintf(stderr, "%s", fmt::format("  unexpected exception: {}\n", e.what()).c_str());
		g_failed = true;
	}
	if (g_failed) {
		std::fprintf(stderr, "%s", fmt::format("[FAILED] {}\n", test.get_name()).c_str());
		return false;
	}
	std::fprintf(stdout, "%s", fmt::format("[passed] {}\n", test.get_name()).c_str());
	return true;
}
} // namespace test

int main() {
	auto ret = EXIT_SUCCESS;
	for (auto* test : test::get_tests()) {
		if (!run_test(*test)) { ret = EXIT_FAILURE; }
	}
	return ret;
}
