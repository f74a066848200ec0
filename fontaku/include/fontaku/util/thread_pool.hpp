#pragma once
#include <fontaku/util/async_queue.hpp>
#include <fontaku/util/pinned.hpp>
#include <fontaku/util/unique_task.hpp>
#include <cstdint>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace fontaku {
///
/// \brief Fixed set of worker threads draining one shared task queue (used to build strikes concurrently).
///
/// Tasks still queued at destruction are dropped; their futures report broken promises.
///
class ThreadPool : public Pinned {
  public:
	///
	/// \param thread_count Worker count, clamped to [1, hardware concurrency]
	///
	explicit ThreadPool(std::uint32_t thread_count);
	~ThreadPool();

	///
	/// \brief Enqueue func for any idle worker.
	/// \returns Future holding func's result, or the exception it threw
	///
	template <typename F>
	auto submit(F func) -> std::future<std::invoke_result_t<F>> {
		using Ret = std::invoke_result_t<F>;
		auto promise = std::promise<Ret>{};
		auto future = promise.get_future();
		submit(std::move(promise), std::move(func));
		return future;
	}

	std::size_t thread_count() const { return m_threads.size(); }

  private:
	template <typename T, typename F>
	void submit(std::promise<T>&& promise, F func) {
		m_queue.push([promise = std::move(promise), func = std::move(func)]() mutable {
			try {
				if constexpr (std::is_void_v<T>) {
					func();
					promise.set_value();
				} else {
					promise.set_value(func());
				}
			} catch (...) { promise.set_exception(std::current_exception()); }
		});
	}

	AsyncQueue<UniqueTask<void()>> m_queue{};
	std::vector<std::jthread> m_threads{};
};
} // namespace fontaku
