#pragma once
#include "spin_lock.h"
#include <mutex>

namespace synckit
{

/**
 * @brief Integer counter that owns its guard.
 *
 * Every read-modify-write runs under a single acquisition of the guard, from
 * the read to the dependent write. Mutex may be SpinLock or any other
 * Lockable type such as std::mutex.
 *
 * The value is a plain int: Add() must not take it outside the int range,
 * signed overflow is undefined behaviour and is not checked.
 */
template <class Mutex = SpinLock>
class GuardedCounter
{
public:
	explicit GuardedCounter(int initial = 0)
		: m_value(initial)
	{
	}

	GuardedCounter(const GuardedCounter&) = delete;
	GuardedCounter& operator=(const GuardedCounter&) = delete;

	// Увеличивает значение на 1, только если оно равно expected.
	// Проверка и запись выполняются под одной блокировкой
	bool ConditionalIncrement(int expected)
	{
		std::lock_guard lock{ m_mutex };
		if (m_value != expected)
		{
			return false;
		}
		++m_value;
		return true;
	}

	void Add(int delta)
	{
		std::lock_guard lock{ m_mutex };
		m_value += delta;
	}

	int Value() const
	{
		std::lock_guard lock{ m_mutex };
		return m_value;
	}

private:
	mutable Mutex m_mutex;
	int m_value;
};

} // namespace synckit
