#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace synckit::test
{

// Запускает каждую задачу в своём потоке и ждёт их завершения не дольше timeout.
// Зависшие потоки отсоединяются, так что дедлок роняет тест, а не подвешивает его.
// Всё, что задачи разделяют между собой, должно жить в shared_ptr
inline bool CompletesWithin(std::chrono::milliseconds timeout, std::vector<std::function<void()>> tasks)
{
	struct State
	{
		std::mutex mutex;
		std::condition_variable done;
		std::size_t finished = 0;
	};
	auto state = std::make_shared<State>();
	const std::size_t total = tasks.size();

	std::vector<std::thread> threads;
	for (auto& task : tasks)
	{
		threads.emplace_back([state, task = std::move(task)] {
			task();
			std::lock_guard lock{ state->mutex };
			++state->finished;
			state->done.notify_all();
		});
	}

	bool finished = false;
	{
		std::unique_lock lock{ state->mutex };
		finished = state->done.wait_for(lock, timeout, [&] { return state->finished == total; });
	}
	for (auto& thread : threads)
	{
		if (finished)
		{
			thread.join();
		}
		else
		{
			thread.detach();
		}
	}
	return finished;
}

// Ждёт, пока pred не станет true, но не дольше timeout
template <typename Pred>
bool WaitUntil(Pred&& pred, std::chrono::milliseconds timeout = std::chrono::seconds{ 5 })
{
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	while (!pred())
	{
		if (std::chrono::steady_clock::now() > deadline)
		{
			return false;
		}
		std::this_thread::yield();
	}
	return true;
}

} // namespace synckit::test
