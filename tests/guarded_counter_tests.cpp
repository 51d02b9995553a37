#include "synckit/guarded_counter.h"
#include "synckit/spin_lock.h"
#include <atomic>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <latch>
#include <mutex>
#include <thread>
#include <vector>

using synckit::GuardedCounter;

namespace
{
constexpr int NumThreads = 16;
} // namespace

TEMPLATE_TEST_CASE("Only one concurrent conditional increment fires", "[guarded_counter]",
	synckit::SpinLock, std::mutex)
{
	GuardedCounter<TestType> counter{ 12 };
	std::atomic<int> fired = 0;
	{
		std::latch start{ NumThreads };
		std::vector<std::jthread> threads;
		for (int i = 0; i < NumThreads; ++i)
		{
			threads.emplace_back([&] {
				start.arrive_and_wait();
				if (counter.ConditionalIncrement(12))
				{
					++fired;
				}
			});
		}
	}
	CHECK(counter.Value() == 13);
	CHECK(fired == 1);
}

TEMPLATE_TEST_CASE("Concurrent Add calls are never lost", "[guarded_counter]",
	synckit::SpinLock, std::mutex)
{
	GuardedCounter<TestType> counter;

	SECTION("one add per thread")
	{
		{
			std::latch start{ NumThreads };
			std::vector<std::jthread> threads;
			for (int i = 0; i < NumThreads; ++i)
			{
				threads.emplace_back([&] {
					start.arrive_and_wait();
					counter.Add(12);
				});
			}
		}
		CHECK(counter.Value() == 12 * NumThreads);
	}

	SECTION("adds and subtracts cancel out")
	{
		constexpr int NumIterations = 50'000;
		{
			std::latch start{ 2 };
			std::jthread t1{ [&] {
				start.arrive_and_wait();
				for (int i = 0; i < NumIterations; ++i)
					counter.Add(12);
			} };
			std::jthread t2{ [&] {
				start.arrive_and_wait();
				for (int i = 0; i < NumIterations; ++i)
					counter.Add(-12);
			} };
		}
		CHECK(counter.Value() == 0);
	}
}

TEST_CASE("ConditionalIncrement leaves a mismatching value untouched", "[guarded_counter]")
{
	GuardedCounter counter{ 5 };
	CHECK_FALSE(counter.ConditionalIncrement(12));
	CHECK(counter.Value() == 5);
	CHECK(counter.ConditionalIncrement(5));
	CHECK(counter.Value() == 6);
}
