#include "counting_semaphore.h"
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>

namespace synckit
{

namespace
{

SemaphoreOptions ValidateOptions(std::ptrdiff_t initialCount, SemaphoreOptions options)
{
	if (initialCount < 0)
	{
		throw std::invalid_argument("Semaphore initial count must not be negative: "
			+ std::to_string(initialCount));
	}
	if (options.capacity)
	{
		if (*options.capacity < 1)
		{
			throw std::invalid_argument("Semaphore capacity must be positive");
		}
		if (*options.capacity < initialCount)
		{
			throw std::invalid_argument("Semaphore initial count " + std::to_string(initialCount)
				+ " exceeds capacity " + std::to_string(*options.capacity));
		}
	}
	return options;
}

} // namespace

CountingSemaphore::CountingSemaphore(std::ptrdiff_t initialCount, SemaphoreOptions options)
	: m_count(initialCount)
	, m_options(ValidateOptions(initialCount, options))
{
}

void CountingSemaphore::acquire() noexcept
{
	// Проверка "count > 0" и уменьшение выполняются под одной блокировкой.
	// Между попытками блокировка отпускается, чтобы release() мог пройти
	while (!try_acquire())
		; // spin
}

bool CountingSemaphore::try_acquire() noexcept
{
	std::lock_guard lock{ m_lock };
	if (m_count == 0)
	{
		return false;
	}
	--m_count;
	return true;
}

void CountingSemaphore::release(std::ptrdiff_t update)
{
	if (update < 0)
	{
		throw std::invalid_argument("Semaphore release update must not be negative");
	}

	// Без заданной ёмкости предел - максимум ptrdiff_t, иначе сложение переполнится
	const std::ptrdiff_t capacity = m_options.capacity.value_or(std::numeric_limits<std::ptrdiff_t>::max());

	std::lock_guard lock{ m_lock };
	if (update > capacity - m_count)
	{
		if (m_options.onOverflow == OverflowPolicy::Reject)
		{
			throw std::overflow_error("Semaphore release exceeds capacity "
				+ std::to_string(capacity));
		}
		m_count = capacity;
		return;
	}
	m_count += update;
}

std::ptrdiff_t CountingSemaphore::available() const noexcept
{
	std::lock_guard lock{ m_lock };
	return m_count;
}

} // namespace synckit
