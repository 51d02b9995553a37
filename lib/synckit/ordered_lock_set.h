#pragma once
#include "spin_lock.h"
#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace synckit
{

using LockRank = std::uintptr_t;

template <class L>
concept Lockable = requires(L& lock) {
	lock.lock();
	lock.unlock();
	{ lock.try_lock() } -> std::convertible_to<bool>;
};

template <class L>
concept RankedLockable = Lockable<L> && requires(const L& lock) {
	{ lock.Rank() } -> std::convertible_to<LockRank>;
};

// Нарушение протокола упорядоченного захвата
class LockOrderError : public std::logic_error
{
public:
	using std::logic_error::logic_error;
};

// Next value of a process-wide increasing sequence, starting at 1
LockRank NextLockRank() noexcept;

/**
 * @brief Lockable wrapper carrying an explicit rank.
 *
 * A default-constructed RankedLock draws its rank from NextLockRank(), so
 * locks created earlier are acquired first. Locks with equal ranks are
 * ordered by address.
 */
template <Lockable Mutex = SpinLock>
class RankedLock
{
public:
	RankedLock()
		: m_rank(NextLockRank())
	{
	}

	explicit RankedLock(LockRank rank)
		: m_rank(rank)
	{
	}

	RankedLock(const RankedLock&) = delete;
	RankedLock& operator=(const RankedLock&) = delete;

	void lock() { m_mutex.lock(); }
	bool try_lock() { return m_mutex.try_lock(); }
	void unlock() { m_mutex.unlock(); }

	LockRank Rank() const noexcept { return m_rank; }

private:
	Mutex m_mutex;
	const LockRank m_rank;
};

// Rank of a lock: the assigned one for RankedLockable types, the address otherwise
template <Lockable L>
LockRank Rank(const L& lock) noexcept
{
	if constexpr (RankedLockable<L>)
	{
		return lock.Rank();
	}
	else
	{
		return reinterpret_cast<LockRank>(std::addressof(lock));
	}
}

namespace detail
{

template <Lockable L>
bool Precedes(const L* a, const L* b) noexcept
{
	const LockRank ra = Rank(*a);
	const LockRank rb = Rank(*b);
	if (ra != rb)
	{
		return ra < rb;
	}
	return std::less<const L*>{}(a, b);
}

} // namespace detail

/**
 * @brief Move-only handle to a set of held locks.
 *
 * Locks are added in strictly ascending rank (LockNext) or, after an
 * out-of-order release, only without blocking (TryReacquire). Release()
 * accepts nothing but the most recently added lock; ReleaseAll() and the
 * destructor unlock everything in reverse order.
 *
 * @tparam L Lockable type of every lock in the set.
 */
template <Lockable L>
class LockSet
{
public:
	LockSet() = default;

	LockSet(const LockSet&) = delete;
	LockSet& operator=(const LockSet&) = delete;

	LockSet(LockSet&& other) noexcept
		: m_held(std::exchange(other.m_held, {}))
	{
	}

	LockSet& operator=(LockSet&& other) noexcept
	{
		if (this != &other)
		{
			ReleaseAll();
			m_held = std::exchange(other.m_held, {});
		}
		return *this;
	}

	~LockSet()
	{
		ReleaseAll();
	}

	/**
	 * @brief Blocks until lock is acquired and adds it to the set.
	 *
	 * @throws LockOrderError if the rank of lock is not above every held rank.
	 *         Nothing is locked in that case.
	 */
	void LockNext(L& lock)
	{
		const bool ascending = std::all_of(m_held.begin(), m_held.end(), [&lock](const L* held) {
			return detail::Precedes<L>(held, &lock);
		});
		if (!ascending)
		{
			throw LockOrderError("Lock rank must be above every held rank");
		}
		// Память резервируется до захвата, чтобы push_back не бросил с захваченной блокировкой
		m_held.reserve(m_held.size() + 1);
		lock.lock();
		m_held.push_back(&lock);
	}

	/**
	 * @brief Attempts to add lock without blocking.
	 *
	 * On failure every held lock is released in reverse order and the set is
	 * left empty, so the caller never waits while holding anything.
	 *
	 * @throws LockOrderError if lock is already held by this set.
	 */
	[[nodiscard]] bool TryReacquire(L& lock)
	{
		if (Holds(lock))
		{
			throw LockOrderError("Lock is already held by this set");
		}
		m_held.reserve(m_held.size() + 1);
		if (lock.try_lock())
		{
			m_held.push_back(&lock);
			return true;
		}
		ReleaseAll();
		return false;
	}

	// Releases the most recently added lock
	void Release(L& lock)
	{
		if (m_held.empty() || m_held.back() != &lock)
		{
			throw LockOrderError(Holds(lock)
					? "Locks must be released in reverse acquisition order"
					: "Lock is not held by this set");
		}
		m_held.pop_back();
		lock.unlock();
	}

	// Releases a held lock out of order. It can only come back through TryReacquire
	void Relinquish(L& lock)
	{
		auto it = std::find(m_held.begin(), m_held.end(), &lock);
		if (it == m_held.end())
		{
			throw LockOrderError("Lock is not held by this set");
		}
		m_held.erase(it);
		lock.unlock();
	}

	void ReleaseAll() noexcept
	{
		while (!m_held.empty())
		{
			L* lock = m_held.back();
			m_held.pop_back();
			lock->unlock();
		}
	}

	[[nodiscard]] bool Holds(const L& lock) const noexcept
	{
		return std::find(m_held.begin(), m_held.end(), std::addressof(lock)) != m_held.end();
	}

	[[nodiscard]] std::size_t Size() const noexcept { return m_held.size(); }
	[[nodiscard]] bool Empty() const noexcept { return m_held.empty(); }

	// Held locks in acquisition order
	std::span<L* const> Held() const noexcept { return m_held; }

private:
	std::vector<L*> m_held;
};

namespace detail
{

template <Lockable L>
LockSet<L> AcquireSorted(std::vector<L*> locks)
{
	if (std::find(locks.begin(), locks.end(), nullptr) != locks.end())
	{
		throw std::invalid_argument("Null lock passed to AcquireInOrder");
	}
	std::sort(locks.begin(), locks.end(), Precedes<L>);
	locks.erase(std::unique(locks.begin(), locks.end()), locks.end());

	// Если LockNext бросит исключение, деструктор set отпустит уже захваченное
	LockSet<L> set;
	for (L* lock : locks)
	{
		set.LockNext(*lock);
	}
	return set;
}

} // namespace detail

/**
 * @brief Acquires every lock in ascending rank order, whatever order the
 *        caller lists them in.
 *
 * Duplicates are acquired once. As long as every call site goes through this
 * function, no cycle can form in the wait-for graph.
 *
 * @return LockSet holding all locks; they are released in descending order.
 */
template <Lockable L>
[[nodiscard]] LockSet<L> AcquireInOrder(std::initializer_list<L*> locks)
{
	return detail::AcquireSorted(std::vector<L*>(locks));
}

template <Lockable L>
[[nodiscard]] LockSet<L> AcquireInOrder(const std::vector<L*>& locks)
{
	return detail::AcquireSorted(locks);
}

template <Lockable L>
[[nodiscard]] bool TryReacquire(LockSet<L>& held, L& lock)
{
	return held.TryReacquire(lock);
}

} // namespace synckit
