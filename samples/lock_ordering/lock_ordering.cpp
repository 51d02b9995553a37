#include "synckit/log.h"
#include "synckit/ordered_lock_set.h"
#include "synckit/retry_policy.h"
#include "synckit/spin_lock.h"
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>

// Два счёта, каждый под своей блокировкой
struct Account
{
	synckit::RankedLock<std::mutex> lock;
	int balance = 0;
};

// Переводы в обе стороны берут одни и те же две блокировки в разном порядке.
// AcquireInOrder всегда захватывает их по возрастанию ранга
void Transfer(Account& from, Account& to, int amount)
{
	auto held = synckit::AcquireInOrder({ &from.lock, &to.lock });
	from.balance -= amount;
	to.balance += amount;
}

void ReversedOrderDemo()
{
	constexpr int NumTransfers = 100'000;
	Account a;
	Account b;
	a.balance = b.balance = 1'000;
	{
		std::jthread t1{ [&] {
			for (int i = 0; i < NumTransfers; ++i)
				Transfer(a, b, 1);
		} };
		std::jthread t2{ [&] {
			for (int i = 0; i < NumTransfers; ++i)
				Transfer(b, a, 1);
		} };
	}
	std::cout << "Reversed call sites finished: a=" << a.balance << " b=" << b.balance
			  << " total=" << a.balance + b.balance << '\n';
}

// Путь, который отпускает A, держа B, и затем снова хочет A.
// Ждать A, держа B, нельзя: другой поток может держать A и ждать B
void ReacquireDemo()
{
	constexpr int NumIterations = 20'000;
	synckit::SpinLock a;
	synckit::SpinLock b;
	std::atomic<int> aborted = 0;
	int completed = 0;

	synckit::RetryPolicy policy;
	policy.backoff = synckit::Backoff::Sleep;
	policy.initialDelay = std::chrono::microseconds{ 1 };
	policy.maxDelay = std::chrono::microseconds{ 50 };
	{
		std::jthread reacquiring{ [&] {
			for (int i = 0; i < NumIterations; ++i)
			{
				synckit::RunWithRetry(policy, [&] {
					auto held = synckit::AcquireInOrder({ &a, &b });
					held.Relinquish(a);
					std::this_thread::yield(); // Работа, которой нужен только B
					if (!synckit::TryReacquire(held, a))
					{
						++aborted; // held уже пуст: B отпущен
						return false;
					}
					++completed;
					return true;
				});
			}
		} };
		std::jthread standard{ [&] {
			for (int i = 0; i < NumIterations; ++i)
			{
				auto held = synckit::AcquireInOrder({ &a, &b });
				++completed;
			}
		} };
	}
	std::cout << "Reacquiring path finished: completed=" << completed
			  << " aborted attempts=" << aborted << '\n';

	// С политикой Once прерванная операция считается окончательной неудачей
	auto blocker = synckit::AcquireInOrder({ &a });
	auto held = synckit::AcquireInOrder({ &b });
	const bool ok = synckit::RunWithRetry(synckit::RetryPolicy::Once(), [&] {
		return synckit::TryReacquire(held, a);
	});
	std::cout << "Once policy with A taken: " << (ok ? "succeeded" : "gave up")
			  << ", B still held: " << std::boolalpha << b.is_locked() << '\n';
}

int main()
{
	synckit::SetLogLevel(synckit::LogLevel::Info);
	ReversedOrderDemo();
	ReacquireDemo();
}
