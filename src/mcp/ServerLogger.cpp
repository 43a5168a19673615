// SPDX-License-Identifier: Apache-2.0
#include "ServerLogger.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <map>
#include <shared_mutex>
#include <vector>

namespace mcprt
{

struct ServerLogger::Impl
{
    mutable std::shared_mutex mutex;
    std::map<std::string, ServerLogLevel, std::less<>> serverLevels;
    ServerLogLevel defaultLevel = ServerLogLevel::Info;
    bool enabled = true;
    std::vector<Callback> callbacks;
};

ServerLogger::ServerLogger(ServerLogLevel defaultLevel): _impl(std::make_unique<Impl>())
{
    _impl->defaultLevel = defaultLevel;
}

ServerLogger::~ServerLogger() = default;

void ServerLogger::setServerLevel(std::string_view serverName, ServerLogLevel level)
{
    auto lock = std::unique_lock(_impl->mutex);
    _impl->serverLevels.insert_or_assign(std::string(serverName), level);
}

void ServerLogger::removeServerLevel(std::string_view serverName)
{
    auto lock = std::unique_lock(_impl->mutex);
    if (auto const it = _impl->serverLevels.find(serverName); it != _impl->serverLevels.end())
        _impl->serverLevels.erase(it);
}

auto ServerLogger::serverLevel(std::string_view serverName) const -> ServerLogLevel
{
    auto lock = std::shared_lock(_impl->mutex);
    auto const it = _impl->serverLevels.find(serverName);
    return it != _impl->serverLevels.end() ? it->second : _impl->defaultLevel;
}

void ServerLogger::setDefaultLevel(ServerLogLevel level)
{
    auto lock = std::unique_lock(_impl->mutex);
    _impl->defaultLevel = level;
}

auto ServerLogger::defaultLevel() const -> ServerLogLevel
{
    auto lock = std::shared_lock(_impl->mutex);
    return _impl->defaultLevel;
}

void ServerLogger::setEnabled(bool enabled)
{
    auto lock = std::unique_lock(_impl->mutex);
    _impl->enabled = enabled;
}

auto ServerLogger::isEnabled() const -> bool
{
    auto lock = std::shared_lock(_impl->mutex);
    return _impl->enabled;
}

void ServerLogger::onLog(Callback callback)
{
    auto lock = std::unique_lock(_impl->mutex);
    _impl->callbacks.push_back(std::move(callback));
}

auto ServerLogger::log(const ServerLogEntry& entry) -> bool
{
    auto callbacks = std::vector<Callback> {};
    {
        auto lock = std::shared_lock(_impl->mutex);
        if (!_impl->enabled)
            return false;

        auto const it = _impl->serverLevels.find(entry.serverName);
        auto const threshold = it != _impl->serverLevels.end() ? it->second : _impl->defaultLevel;
        if (entry.level < threshold)
            return false;

        callbacks = _impl->callbacks;
    }

    auto const source = entry.logger ? std::format("{}/{}", entry.serverName, *entry.logger) : entry.serverName;
    switch (entry.level)
    {
        case ServerLogLevel::Debug: log::debug("[{}] {}", source, entry.message); break;
        case ServerLogLevel::Info: log::info("[{}] {}", source, entry.message); break;
        case ServerLogLevel::Warn: log::warning("[{}] {}", source, entry.message); break;
        case ServerLogLevel::Error: log::error("[{}] {}", source, entry.message); break;
    }

    for (const auto& callback: callbacks)
        callback(entry);

    return true;
}

auto ServerLogger::handleLogNotification(std::string_view serverName, const nlohmann::json& params) -> bool
{
    if (!params.is_object())
        return false;

    auto entry = ServerLogEntry {
        .serverName = std::string(serverName),
        .level = parseServerLogLevel(json::getStringOr(params, "level", "info")),
        .message = {},
        .data = params.value("data", nlohmann::json {}),
        .logger = std::nullopt,
    };

    if (auto logger = json::getString(params, "logger"))
        entry.logger = std::move(*logger);

    // "data" may be any JSON value; strings are logged verbatim.
    entry.message = entry.data.is_string() ? entry.data.get<std::string>() : entry.data.dump();

    return log(entry);
}

} // namespace mcprt
