#include "retry_policy.h"
#include <algorithm>
#include <random>
#include <thread>

namespace synckit
{

namespace
{

std::chrono::microseconds SleepDelay(const RetryPolicy& policy, unsigned failedAttempts)
{
	// Удваиваем задержку после каждой неудачи, но не дальше maxDelay
	const unsigned shift = std::min(failedAttempts - 1, 20u);
	const auto delay = std::min<std::chrono::microseconds>(policy.initialDelay * (1LL << shift), policy.maxDelay);
	if (delay.count() <= 0)
	{
		return std::chrono::microseconds{ 0 };
	}

	// Случайная добавка разводит потоки, которые откатились одновременно
	thread_local std::minstd_rand engine{ std::random_device{}() };
	std::uniform_int_distribution<long long> jitter{ 0, delay.count() };
	return delay + std::chrono::microseconds{ jitter(engine) };
}

} // namespace

void PauseBeforeRetry(const RetryPolicy& policy, unsigned failedAttempts)
{
	switch (policy.backoff)
	{
	case Backoff::Spin:
		break;
	case Backoff::Yield:
		std::this_thread::yield();
		break;
	case Backoff::Sleep:
		std::this_thread::sleep_for(SleepDelay(policy, std::max(failedAttempts, 1u)));
		break;
	}
}

} // namespace synckit
