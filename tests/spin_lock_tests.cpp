#include "synckit/spin_lock.h"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <latch>
#include <mutex>
#include <thread>
#include <vector>

using synckit::SpinLock;

TEST_CASE("SpinLock try_lock succeeds only on a free lock", "[spin_lock]")
{
	SpinLock lock;
	REQUIRE_FALSE(lock.is_locked());

	REQUIRE(lock.try_lock());
	CHECK(lock.is_locked());
	CHECK_FALSE(lock.try_lock());

	lock.unlock();
	CHECK_FALSE(lock.is_locked());
	CHECK(lock.try_lock());
	lock.unlock();
}

TEST_CASE("Exactly one of many simultaneous try_lock calls wins", "[spin_lock]")
{
	constexpr int NumThreads = 8;
	SpinLock lock;
	std::atomic<int> winners = 0;
	{
		std::latch start{ NumThreads };
		std::vector<std::jthread> threads;
		for (int i = 0; i < NumThreads; ++i)
		{
			threads.emplace_back([&] {
				start.arrive_and_wait();
				if (lock.try_lock())
				{
					++winners;
				}
			});
		}
	}
	CHECK(winners == 1);
	CHECK(lock.is_locked());
	lock.unlock();
}

TEST_CASE("SpinLock serializes increments from many threads", "[spin_lock]")
{
	constexpr int NumThreads = 8;
	constexpr int NumIterations = 100'000;
	SpinLock lock;
	int counter = 0;
	{
		std::latch start{ NumThreads };
		std::vector<std::jthread> threads;
		for (int i = 0; i < NumThreads; ++i)
		{
			threads.emplace_back([&] {
				start.arrive_and_wait();
				for (int j = 0; j < NumIterations; ++j)
				{
					// Конструктор lock_guard вызовет lock(), а деструктор - unlock()
					std::lock_guard lk{ lock };
					++counter;
				}
			});
		}
	}
	CHECK(counter == NumThreads * NumIterations);
	CHECK_FALSE(lock.is_locked());
}

TEST_CASE("SpinLock works with std::unique_lock try_to_lock", "[spin_lock]")
{
	SpinLock lock;
	{
		std::unique_lock first{ lock, std::try_to_lock };
		REQUIRE(first.owns_lock());

		std::unique_lock second{ lock, std::try_to_lock };
		CHECK_FALSE(second.owns_lock());
	}
	CHECK_FALSE(lock.is_locked());
}
