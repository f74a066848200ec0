#pragma once
#include <fontaku/util/ptr.hpp>
#include <charconv>
#include <concepts>
#include <span>
#include <string_view>
#include <vector>

namespace fontaku::cli_args {
enum class Result { eContinue, eExitFailure, eExitSuccess };

///
/// \brief Long (--output) and / or short (-o) name of an option.
///
struct Key {
	std::string_view full{};
	char single{};

	constexpr bool valid() const { return !full.empty() || single != '\0'; }
};

using Value = std::string_view;

struct Opt {
	Key key{};
	///
	/// \brief Placeholder shown in help (empty for flags).
	///
	Value value{};
	bool is_optional_value{};
	std::string_view help{};
};

///
/// \brief Receives options and trailing arguments as they are parsed.
///
struct Parser {
	virtual ~Parser() = default;

	///
	/// \brief Called once per option occurrence, in command line order.
	/// \returns false to abort parsing
	///
	virtual bool option(Key key, Value value) = 0;
	///
	/// \brief Called once with every argument after the options (possibly none).
	/// \returns false to abort parsing
	///
	virtual bool arguments(std::span<char const* const> args) = 0;
};

struct Spec {
	std::string_view app_name{};
	std::vector<Opt> options{};
	///
	/// \brief Usage text for trailing arguments.
	///
	std::string_view arguments{};
	std::string_view version{"(unknown)"};
};

///
/// \brief Parse an integral option value.
/// \param out Target to assign on success
/// \param value Text to parse (base 10, or base 16 with a 0x prefix)
/// \returns true if the whole of value was consumed
///
template <std::integral Type>
bool as(Type& out, std::string_view value) {
	auto base = 10;
	if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
		value = value.substr(2);
		base = 16;
	}
	if (value.empty()) { return false; }
	auto const* end = value.data() + value.size();
	auto const [ptr, ec] = std::from_chars(value.data(), end, out, base);
	return ec == std::errc{} && ptr == end;
}

///
/// \brief Parse command line arguments (excluding the program name).
///
/// Options take values only as --key=value or -k=value; short flags may be grouped (-vf).
/// Parsing stops at the first non-option argument or after "--".
/// --help and --version are handled here and return eExitSuccess.
///
Result parse(Spec spec, Ptr<Parser> out, std::span<char const* const> args);
} // namespace fontaku::cli_args
