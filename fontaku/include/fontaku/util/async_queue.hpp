#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace fontaku {
///
/// \brief Blocking FIFO shared between producer threads and worker threads.
///
/// Feeds the file logger and ThreadPool workers.
///
template <typename Type>
class AsyncQueue {
  public:
	void push(Type t) {
		auto lock = std::unique_lock{m_mutex};
		m_queue.push_back(std::move(t));
		lock.unlock();
		m_cv.notify_one();
	}

	///
	/// \brief Wait for the next item.
	/// \returns std::nullopt once stop is requested (pending items stay queued)
	///
	std::optional<Type> pop(std::stop_token const& stop) {
		auto lock = std::unique_lock{m_mutex};
		m_cv.wait(lock, stop, [this] { return !m_queue.empty(); });
		if (stop.stop_requested() || m_queue.empty()) { return {}; }
		auto ret = std::move(m_queue.front());
		m_queue.pop_front();
		return ret;
	}

	///
	/// \brief Take every pending item and wake all waiting threads.
	///
	std::deque<Type> release() {
		auto lock = std::unique_lock{m_mutex};
		auto ret = std::move(m_queue);
		m_queue.clear();
		lock.unlock();
		m_cv.notify_all();
		return ret;
	}

  private:
	std::deque<Type> m_queue{};
	std::condition_variable_any m_cv{};
	std::mutex m_mutex{};
};
} // namespace fontaku
