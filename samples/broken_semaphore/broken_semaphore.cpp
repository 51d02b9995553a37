#include "synckit/counting_semaphore.h"
#include "synckit/spin_lock.h"
#include <atomic>
#include <iostream>
#include <latch>
#include <mutex>
#include <thread>
#include <vector>

// АНТИПАТТЕРН: ждём ненулевого счётчика, а уменьшаем его отдельным захватом.
// Несколько ожидающих видят одно и то же значение 1 и все его уменьшают
class BrokenSemaphore
{
public:
	explicit BrokenSemaphore(int initialCount)
		: m_count(initialCount)
	{
	}

	void acquire()
	{
		while (Count() <= 0)
			; // spin
		std::this_thread::yield(); // Расширяем окно гонки
		std::lock_guard lock{ m_lock };
		--m_count;
	}

	void release()
	{
		std::lock_guard lock{ m_lock };
		++m_count;
	}

	int Count()
	{
		std::lock_guard lock{ m_lock };
		return m_count;
	}

private:
	synckit::SpinLock m_lock;
	int m_count;
};

struct Stats
{
	std::atomic<int> inside = 0;
	std::atomic<int> maxInside = 0;
	std::atomic<long long> minCount = 1;
};

void RecordMax(std::atomic<int>& max, int value)
{
	int prev = max;
	while (value > prev && !max.compare_exchange_weak(prev, value))
		;
}

template <typename Semaphore, typename CountFn>
void Hammer(Semaphore& sem, CountFn&& count, Stats& stats)
{
	constexpr int NumThreads = 8;
	constexpr int NumIterations = 20'000;
	std::latch start{ NumThreads };
	std::vector<std::jthread> threads;
	for (int i = 0; i < NumThreads; ++i)
	{
		threads.emplace_back([&] {
			start.arrive_and_wait();
			for (int j = 0; j < NumIterations; ++j)
			{
				sem.acquire();
				RecordMax(stats.maxInside, ++stats.inside);
				const long long now = count();
				if (now < stats.minCount)
				{
					stats.minCount = now;
				}
				--stats.inside;
				sem.release();
			}
		});
	}
}

int main()
{
	BrokenSemaphore broken{ 1 };
	Stats brokenStats;
	Hammer(broken, [&] { return broken.Count(); }, brokenStats);
	std::cout << "Broken semaphore (spin, then decrement separately):\n"
			  << "  min count seen: " << brokenStats.minCount
			  << ", max holders: " << brokenStats.maxInside << '\n';

	synckit::CountingSemaphore sem{ 1 };
	Stats stats;
	Hammer(sem, [&] { return static_cast<long long>(sem.available()); }, stats);
	std::cout << "synckit::CountingSemaphore (check and decrement under one guard):\n"
			  << "  min count seen: " << stats.minCount
			  << ", max holders: " << stats.maxInside << '\n';
}
