// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <format>
#include <mutex>
#include <print>
#include <string>
#include <utility>

namespace mcprt::log
{

namespace
{
    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};
    auto globalTimestamps = std::atomic<bool> { false };

    auto currentTime() -> std::string
    {
        // UTC, millisecond precision.
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        return std::format("{:%H:%M:%S}", now);
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto lock = std::lock_guard(globalMutex);
    globalCallback = std::move(callback);
}

auto exchangeCallback(LogCallback callback) -> LogCallback
{
    auto lock = std::lock_guard(globalMutex);
    return std::exchange(globalCallback, std::move(callback));
}

void setTimestamps(bool enabled)
{
    globalTimestamps.store(enabled, std::memory_order_relaxed);
}

void setLevel(Level level)
{
    globalLevel.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return globalLevel.load(std::memory_order_relaxed);
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    auto lower = std::string(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "error")
        return Level::Error;
    if (lower == "warn" || lower == "warning")
        return Level::Warning;
    if (lower == "info")
        return Level::Info;
    if (lower == "debug")
        return Level::Debug;
    if (lower == "trace")
        return Level::Trace;
    return std::nullopt;
}

auto levelName(Level level) -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
    }
    return "unknown";
}

void write(Level level, std::string_view message)
{
    if (!isEnabled(level))
        return;

    auto lock = std::lock_guard(globalMutex);

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    constexpr auto levelPrefix = [](Level l) -> std::string_view {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    };

    if (globalTimestamps.load(std::memory_order_relaxed))
        std::println(stderr, "{} [{}] {}", currentTime(), levelPrefix(level), message);
    else
        std::println(stderr, "[{}] {}", levelPrefix(level), message);
}

} // namespace mcprt::log
