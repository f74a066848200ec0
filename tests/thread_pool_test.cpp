#include <fixtures.hpp>
#include <fontaku/util/thread_pool.hpp>
#include <test/test.hpp>
#include <atomic>
#include <stdexcept>

namespace {
using namespace fontaku;

ADD_TEST(ThreadPoolRunsTasks) {
	auto pool = ThreadPool{4};
	EXPECT(pool.thread_count() >= 1u);
	EXPECT(pool.thread_count() <= 4u);

	auto counter = std::atomic<int>{};
	auto futures = std::vector<std::future<int>>{};
	for (int i = 0; i < 32; ++i) {
		futures.push_back(pool.submit([i, &counter] {
			++counter;
			return i * i;
		}));
	}
	for (int i = 0; i < 32; ++i) { EXPECT(futures[static_cast<std::size_t>(i)].get() == i * i); }
	EXPECT(counter == 32);
}

ADD_TEST(ThreadPoolForwardsExceptions) {
	auto pool = ThreadPool{2};
	auto future = pool.submit([]() -> int { throw std::runtime_error{"boom"}; });
	EXPECT(fixture::throws<std::runtime_error>([&] { future.get(); }));

	auto done = pool.submit([] {});
	done.get();
}
} // namespace
