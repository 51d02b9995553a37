#include "log.h"
#include <atomic>

namespace synckit
{

namespace
{
std::atomic<LogLevel> g_logLevel{ LogLevel::Off };
} // namespace

void SetLogLevel(LogLevel level) noexcept
{
	g_logLevel.store(level, std::memory_order_relaxed);
}

LogLevel GetLogLevel() noexcept
{
	return g_logLevel.load(std::memory_order_relaxed);
}

} // namespace synckit
