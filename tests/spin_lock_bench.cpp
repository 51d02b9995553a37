#include "synckit/spin_lock.h"
#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>
#include <mutex>
#include <thread>

namespace
{

template <typename Lockable>
int IncrementDecrement(int numIterations)
{
	Lockable lock;
	int counter = 0;
	std::jthread t1{ [&] {
		for (int i = 0; i < numIterations; ++i)
		{
			std::lock_guard lk{ lock };
			++counter;
		}
	} };
	std::jthread t2{ [&] {
		for (int i = 0; i < numIterations; ++i)
		{
			std::lock_guard lk{ lock };
			--counter;
		}
	} };
	t1.join();
	t2.join();
	return counter;
}

} // namespace

TEST_CASE("SpinLock vs std::mutex", "[.benchmark]")
{
	constexpr int NumIterations = 100'000;

	BENCHMARK("SpinLock 2 threads")
	{
		return IncrementDecrement<synckit::SpinLock>(NumIterations);
	};

	BENCHMARK("std::mutex 2 threads")
	{
		return IncrementDecrement<std::mutex>(NumIterations);
	};
}
