#include "ordered_lock_set.h"
#include <atomic>

namespace synckit
{

LockRank NextLockRank() noexcept
{
	static std::atomic<LockRank> nextRank{ 1 };
	return nextRank.fetch_add(1, std::memory_order_relaxed);
}

} // namespace synckit
