#pragma once
#include "spin_lock.h"
#include <cstddef>
#include <optional>

namespace synckit
{

enum class OverflowPolicy
{
	Reject, // release() throws std::overflow_error, count is unchanged
	Clamp, // count saturates at capacity
};

struct SemaphoreOptions
{
	// std::nullopt - bounded only by PTRDIFF_MAX
	std::optional<std::ptrdiff_t> capacity;
	OverflowPolicy onOverflow = OverflowPolicy::Reject;
};

/**
 * @brief Busy-wait counting semaphore guarded by a SpinLock.
 *
 * acquire() checks that the count is positive and decrements it under the
 * same guard acquisition, so the count never drops below zero no matter how
 * many threads wait concurrently. Waiting threads spin instead of sleeping.
 *
 * @throws std::invalid_argument if the initial count is negative or the
 *         configured capacity is below 1 or below the initial count.
 */
class CountingSemaphore
{
public:
	explicit CountingSemaphore(std::ptrdiff_t initialCount, SemaphoreOptions options = {});

	CountingSemaphore(const CountingSemaphore&) = delete;
	CountingSemaphore& operator=(const CountingSemaphore&) = delete;

	void acquire() noexcept;
	bool try_acquire() noexcept;

	/**
	 * @brief Returns update permits to the semaphore in one guarded step.
	 *
	 * @throws std::invalid_argument if update is negative.
	 * @throws std::overflow_error with OverflowPolicy::Reject if the new count
	 *         would exceed the capacity, or PTRDIFF_MAX when none is set.
	 */
	void release(std::ptrdiff_t update = 1);

	[[nodiscard]] std::ptrdiff_t available() const noexcept;
	[[nodiscard]] const SemaphoreOptions& options() const noexcept { return m_options; }

private:
	mutable SpinLock m_lock;
	std::ptrdiff_t m_count;
	const SemaphoreOptions m_options;
};

} // namespace synckit
