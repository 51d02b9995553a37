#pragma once
#include "spin_lock.h"
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace synckit
{

/**
 * @brief Key -> count map whose check-then-insert sequence is atomic.
 *
 * One guard covers the whole map, so two threads racing on the same missing
 * key cannot both observe it as absent.
 */
template <class Key, class Mutex = SpinLock, class Hash = std::hash<Key>>
class GuardedMap
{
public:
	using Counts = std::unordered_map<Key, int, Hash>;

	GuardedMap() = default;

	GuardedMap(const GuardedMap&) = delete;
	GuardedMap& operator=(const GuardedMap&) = delete;

	// Inserts key with count 1 or increments the existing count.
	// Returns the count stored after the call.
	int UpsertOrIncrement(const Key& key)
	{
		std::lock_guard lock{ m_mutex };
		auto it = m_counts.find(key);
		if (it == m_counts.end())
		{
			m_counts.emplace(key, 1);
			return 1;
		}
		return ++it->second;
	}

	std::optional<int> Get(const Key& key) const
	{
		std::lock_guard lock{ m_mutex };
		auto it = m_counts.find(key);
		if (it == m_counts.end())
		{
			return std::nullopt;
		}
		return it->second;
	}

	std::size_t Size() const
	{
		std::lock_guard lock{ m_mutex };
		return m_counts.size();
	}

	Counts Snapshot() const
	{
		std::lock_guard lock{ m_mutex };
		return m_counts;
	}

private:
	mutable Mutex m_mutex;
	Counts m_counts;
};

} // namespace synckit
