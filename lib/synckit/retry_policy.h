#pragma once
#include "log.h"
#include <chrono>
#include <type_traits>

namespace synckit
{

enum class Backoff
{
	Spin, // retry immediately
	Yield, // std::this_thread::yield()
	Sleep, // exponential sleep with random jitter
};

/**
 * @brief What to do after a try-acquire-and-backoff operation aborts.
 *
 * maxAttempts counts the first run too; 0 means no limit.
 */
struct RetryPolicy
{
	unsigned maxAttempts = 0;
	Backoff backoff = Backoff::Yield;
	std::chrono::microseconds initialDelay{ 1 };
	std::chrono::microseconds maxDelay{ 1'000 };

	static RetryPolicy Forever() noexcept { return {}; }

	static RetryPolicy Once() noexcept
	{
		RetryPolicy policy;
		policy.maxAttempts = 1;
		return policy;
	}
};

// Waits according to policy after failedAttempts unsuccessful runs
void PauseBeforeRetry(const RetryPolicy& policy, unsigned failedAttempts);

/**
 * @brief Runs attempt until it returns true or the policy gives up.
 *
 * attempt must leave no lock held when it returns false, which is what
 * TryReacquire guarantees on failure.
 *
 * @return true if some run succeeded, false if maxAttempts runs all aborted.
 */
template <class Attempt>
	requires std::is_invocable_r_v<bool, Attempt&>
bool RunWithRetry(const RetryPolicy& policy, Attempt&& attempt)
{
	for (unsigned n = 1;; ++n)
	{
		if (attempt())
		{
			return true;
		}
		if (policy.maxAttempts != 0 && n >= policy.maxAttempts)
		{
			Log(LogLevel::Info, "giving up after ", n, " aborted attempt(s)");
			return false;
		}
		Log(LogLevel::Debug, "attempt ", n, " aborted, retrying");
		PauseBeforeRetry(policy, n);
	}
}

} // namespace synckit
