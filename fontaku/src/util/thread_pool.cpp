#include <fontaku/util/thread_pool.hpp>
#include <algorithm>

namespace fontaku {
ThreadPool::ThreadPool(std::uint32_t const thread_count) {
	auto const hc = std::max(std::thread::hardware_concurrency(), 1u);
	auto const count = std::clamp(thread_count, 1u, hc);

	auto agent = [this](std::stop_token const& stop) {
		while (auto task = m_queue.pop(stop)) { (*task)(); }
	};
	for (std::uint32_t i = 0; i < count; ++i) { m_threads.push_back(std::jthread{agent}); }
}

ThreadPool::~ThreadPool() {
	for (auto& thread : m_threads) { thread.request_stop(); }
	m_queue.release();
	m_threads.clear();
}
} // namespace fontaku
