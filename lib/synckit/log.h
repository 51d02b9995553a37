#pragma once
#include <iostream>
#include <syncstream> // std::osyncstream
#include <utility>

namespace synckit
{

enum class LogLevel
{
	Off,
	Info,
	Debug,
};

void SetLogLevel(LogLevel level) noexcept;
LogLevel GetLogLevel() noexcept;

inline bool LogEnabled(LogLevel level) noexcept
{
	return level != LogLevel::Off && level <= GetLogLevel();
}

// Пишет одну строку в std::clog. osyncstream не даёт строкам
// разных потоков перемешаться
template <typename... Args>
void Log(LogLevel level, Args&&... args)
{
	if (!LogEnabled(level))
	{
		return;
	}
	std::osyncstream out{ std::clog };
	out << "[synckit] ";
	(out << ... << std::forward<Args>(args));
	out << '\n';
}

} // namespace synckit
