#include "synckit/guarded_counter.h"
#include "synckit/guarded_map.h"
#include "synckit/spin_lock.h"
#include <iostream>
#include <latch>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

// АНТИПАТТЕРН: проверка и действие защищены РАЗНЫМИ захватами блокировки.
// Между ними другой поток успевает выполнить ту же проверку
class SplitGuardCounter
{
public:
	explicit SplitGuardCounter(int initial)
		: m_value(initial)
	{
	}

	void ConditionalIncrement(int expected)
	{
		bool matches = false;
		{
			std::lock_guard lock{ m_lock };
			matches = m_value == expected;
		}
		std::this_thread::yield(); // Расширяем окно гонки
		if (matches)
		{
			std::lock_guard lock{ m_lock };
			++m_value;
		}
	}

	int Value()
	{
		std::lock_guard lock{ m_lock };
		return m_value;
	}

private:
	synckit::SpinLock m_lock;
	int m_value;
};

// АНТИПАТТЕРН: "проверить отсутствие ключа" и "вставить" - два отдельных захвата
class SplitGuardMap
{
public:
	void UpsertOrIncrement(const std::string& key)
	{
		bool found = false;
		{
			std::lock_guard lock{ m_lock };
			found = m_counts.contains(key);
		}
		std::this_thread::yield();
		std::lock_guard lock{ m_lock };
		if (found)
		{
			++m_counts[key];
		}
		else
		{
			m_counts[key] = 1; // Затирает вставку другого потока
		}
	}

	int Get(const std::string& key)
	{
		std::lock_guard lock{ m_lock };
		return m_counts[key];
	}

private:
	synckit::SpinLock m_lock;
	std::unordered_map<std::string, int> m_counts;
};

template <typename Fn>
void RunConcurrently(int numThreads, Fn&& fn)
{
	std::latch start{ numThreads };
	std::vector<std::jthread> threads;
	for (int i = 0; i < numThreads; ++i)
	{
		threads.emplace_back([&] {
			start.arrive_and_wait();
			fn();
		});
	}
	// jthread сам делает join() в деструкторе
}

int main()
{
	constexpr int NumThreads = 16;

	SplitGuardCounter brokenCounter{ 12 };
	RunConcurrently(NumThreads, [&] { brokenCounter.ConditionalIncrement(12); });
	synckit::GuardedCounter<> counter{ 12 };
	RunConcurrently(NumThreads, [&] { counter.ConditionalIncrement(12); });
	std::cout << "if (value == 12) ++value, " << NumThreads << " threads\n"
			  << "  split guard:  " << brokenCounter.Value() << '\n'
			  << "  single guard: " << counter.Value() << " (expected 13)\n";

	synckit::GuardedCounter<> sum;
	RunConcurrently(NumThreads, [&] { sum.Add(12); });
	std::cout << "value += 12, " << NumThreads << " threads: " << sum.Value()
			  << " (expected " << 12 * NumThreads << ")\n";

	SplitGuardMap brokenMap;
	RunConcurrently(NumThreads, [&] { brokenMap.UpsertOrIncrement("y"); });
	synckit::GuardedMap<std::string> map;
	RunConcurrently(NumThreads, [&] { map.UpsertOrIncrement("y"); });
	std::cout << "upsert_or_increment(\"y\"), " << NumThreads << " threads\n"
			  << "  split guard:  " << brokenMap.Get("y") << '\n'
			  << "  single guard: " << map.Get("y").value_or(0) << " (expected " << NumThreads << ")\n";
}
