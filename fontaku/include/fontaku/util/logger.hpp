#pragma once
#include <fmt/format.h>
#include <fontaku/defines.hpp>
#include <fontaku/util/enum_array.hpp>
#include <fontaku/util/pinned.hpp>
#include <cstdint>
#include <string>
#include <string_view>

namespace fontaku {
///
/// \brief Leveled, fmt formatted console logger with optional sinks.
///
/// Errors and warnings go to stderr, everything else to stdout; every printed entry is also
/// forwarded to attached sinks (eg the log file opened by Logger::Instance).
///
class Logger {
  public:
	enum class Level : std::uint8_t { eError, eWarn, eInfo, eDebug, eCOUNT_ };
	static constexpr auto levels_v{EnumArray<Level, char>{'E', 'W', 'I', 'D'}};

	///
	/// \brief Format of console lines.
	///
	/// Available arguments: thread, level, context, message, timestamp.
	///
	inline static std::string s_format{"[{level}] [{context}] {message}"};

	struct Entry {
		std::string formatted_message{};
		Level level{};
	};

	class Instance;
	struct Sink;

	///
	/// \brief Small stable id for the calling thread (0 for the first thread that logs).
	///
	static int thread_id();

	///
	/// \brief Register a sink; it detaches itself on destruction.
	///
	static void attach(Sink& out_sink);

	static void dispatch(Entry entry);

	static std::string format(Level level, std::string_view context, std::string_view message);

	Logger(std::string_view context = "fontaku") : context(context) {}

	template <typename... Args>
	void log(Level const level, fmt::format_string<Args...> fmt, Args const&... args) const {
		if (silent[level]) { return; }
		dispatch(Entry{format(level, context, fmt::vformat(fmt, fmt::make_format_args(args...))), level});
	}

	template <typename... Args>
	void error(fmt::format_string<Args...> fmt, Args const&... args) const {
		log(Level::eError, fmt, args...);
	}

	template <typename... Args>
	void warn(fmt::format_string<Args...> fmt, Args const&... args) const {
		log(Level::eWarn, fmt, args...);
	}

	template <typename... Args>
	void info(fmt::format_string<Args...> fmt, Args const&... args) const {
		log(Level::eInfo, fmt, args...);
	}

	///
	/// \brief Compiled out unless FONTAKU_DEBUG is defined.
	///
	template <typename... Args>
	void debug(fmt::format_string<Args...> fmt, Args const&... args) const {
		if constexpr (debug_v) { log(Level::eDebug, fmt, args...); }
	}

	///
	/// \brief Suppress every level more verbose than max_level.
	///
	void silence_above(Level const max_level) {
		for (std::size_t i = 0; i < silent.size(); ++i) { silent.t[i] = static_cast<Level>(i) > max_level; }
	}

	std::string_view context{};
	EnumArray<Level, bool> silent{};
};

struct Logger::Sink : Pinned {
	virtual ~Sink();

	virtual void on_log(Entry const& entry) = 0;
};

///
/// \brief Mirrors every entry into a file (truncated on open) while alive.
///
/// File lines are prefixed with a wall clock timestamp. Writes happen on a background thread;
/// entries still queued on destruction are flushed before the file is closed.
/// Only one Instance may be alive at a time; constructing a second throws Error.
///
class Logger::Instance : public Pinned {
  public:
	explicit Instance(char const* file_path = "fontaku.log");
	~Instance();
};

inline auto const g_logger{Logger{}};
} // namespace fontaku
