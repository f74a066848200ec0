#include <fontaku/error.hpp>
#include <fontaku/util/async_queue.hpp>
#include <fontaku/util/logger.hpp>
#include <fontaku/util/ptr.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace fontaku {
namespace {
std::string wall_time(char const* format) {
	auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	auto tm = std::tm{};
	if (!localtime_r(&now, &tm)) { return {}; }
	char buffer[32]{};
	if (!std::strftime(buffer, sizeof(buffer), format, &tm)) { return {}; }
	return buffer;
}

class LogFile : public Logger::Sink {
  public:
	explicit LogFile(std::filesystem::path path) : m_path(std::move(path)), m_file(m_path, std::ios::trunc) {
		if (!m_file) {
			std::fprintf(stderr, "%s", fmt::format("[W] [fontaku] failed to open log file: {}\n", m_path.generic_string()).c_str());
			return;
		}
		m_thread = std::jthread{[this](std::stop_token const& stop) { drain(stop); }};
	}

	~LogFile() override {
		if (!m_thread.joinable()) { return; }
		m_thread.request_stop();
		m_thread.join();
		for (auto const& line : m_queue.release()) { m_file << line << '\n'; }
	}

  private:
	void drain(std::stop_token const& stop) {
		while (auto line = m_queue.pop(stop)) { m_file << *line << '\n' << std::flush; }
	}

	void on_log(Logger::Entry const& entry) final {
		if (!m_thread.joinable()) { return; }
		m_queue.push(fmt::format("{} {}", wall_time("%Y-%m-%d %H:%M:%S"), entry.formatted_message));
	}

	std::filesystem::path m_path{};
	std::ofstream m_file{};
	AsyncQueue<std::string> m_queue{};
	std::jthread m_thread{};
};

struct Registry {
	std::vector<Ptr<Logger::Sink>> sinks{};
	std::optional<LogFile> log_file{};
	std::unordered_map<std::thread::id, int> thread_ids{};
	std::mutex mutex{};
};

Registry g_registry{};
} // namespace

Logger::Sink::~Sink() {
	auto lock = std::scoped_lock{g_registry.mutex};
	std::erase(g_registry.sinks, this);
}

int Logger::thread_id() {
	auto lock = std::scoped_lock{g_registry.mutex};
	auto const next = static_cast<int>(g_registry.thread_ids.size());
	return g_registry.thread_ids.try_emplace(std::this_thread::get_id(), next).first->second;
}

void Logger::attach(Sink& out_sink) {
	auto lock = std::scoped_lock{g_registry.mutex};
	g_registry.sinks.push_back(&out_sink);
}

Logger::Instance::Instance(char const* file_path) {
	auto lock = std::scoped_lock{g_registry.mutex};
	// replacing an open file would run ~Sink under this lock
	if (g_registry.log_file) { throw Error{fmt::format("log file already open, cannot open: {}", file_path)}; }
	g_registry.log_file.emplace(file_path);
	g_registry.sinks.push_back(&*g_registry.log_file);
}

Logger::Instance::~Instance() {
	auto lock = std::unique_lock{g_registry.mutex};
	if (!g_registry.log_file) { return; }
	std::erase(g_registry.sinks, &*g_registry.log_file);
	lock.unlock();
	// ~Sink locks the registry
	g_registry.log_file.reset();
}

std::string Logger::format(Level level, std::string_view context, std::string_view const message) {
	if (context.empty()) { context = "Unknown"; }
	return fmt::format(fmt::runtime(s_format), fmt::arg("thread", thread_id()), fmt::arg("level", levels_v[level]), fmt::arg("context", context),
					   fmt::arg("message", message), fmt::arg("timestamp", wall_time("%H:%M:%S")));
}

void Logger::dispatch(Entry entry) {
	auto* fd = entry.level <= Level::eWarn ? stderr : stdout;
	std::fprintf(fd, "%s\n", entry.formatted_message.c_str());
	auto lock = std::scoped_lock{g_registry.mutex};
	for (auto* sink : g_registry.sinks) { sink->on_log(entry); }
}
} // namespace fontaku
