#pragma once
#include <atomic>
#include <cassert>

namespace synckit
{

/**
 * @brief Busy-wait mutex on top of a single test-and-set flag.
 *
 * Satisfies the standard Lockable requirements, so std::lock_guard,
 * std::unique_lock and std::scoped_lock work with it.
 * Waiters never sleep and are not queued: any of them may win the flag,
 * so keep critical sections short.
 */
class SpinLock
{
public:
	SpinLock() = default;

	SpinLock(const SpinLock&) = delete;
	SpinLock& operator=(const SpinLock&) = delete;

	// test_and_set возвращает старое значение флага и устанавливает его в true
	bool try_lock() noexcept
	{
		return !m_locked.test_and_set(std::memory_order_acquire);
	}

	void lock() noexcept
	{
		while (!try_lock())
		{
			// Пока флаг занят, читаем его без записи, чтобы не гонять кэш-линию
			while (m_locked.test(std::memory_order_relaxed))
				; // spin
		}
	}

	// Only the current holder may call unlock()
	void unlock() noexcept
	{
		assert(m_locked.test(std::memory_order_relaxed) && "unlock of a free SpinLock");
		m_locked.clear(std::memory_order_release);
	}

	[[nodiscard]] bool is_locked() const noexcept
	{
		return m_locked.test(std::memory_order_relaxed);
	}

private:
	std::atomic_flag m_locked = ATOMIC_FLAG_INIT;
};

} // namespace synckit
