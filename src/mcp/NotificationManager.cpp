// SPDX-License-Identifier: Apache-2.0
#include "NotificationManager.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <deque>
#include <map>
#include <shared_mutex>
#include <utility>

namespace mcprt
{

namespace
{

    /// @brief Active progress is keyed by (server, progress token).
    using ProgressKey = std::pair<std::string, std::string>;

    auto progressKey(std::string_view serverName, std::string_view token) -> ProgressKey
    {
        return { std::string(serverName), std::string(token) };
    }

    /// @brief Progress tokens may be strings or numbers on the wire.
    auto tokenOf(const nlohmann::json& params) -> std::string
    {
        auto const it = params.find("progressToken");
        if (it == params.end())
            return "unknown";
        if (it->is_string())
            return it->get<std::string>();
        if (it->is_number())
            return it->dump();
        return "unknown";
    }

    auto numberOf(const nlohmann::json& params, const char* key) -> std::optional<double>
    {
        auto const it = params.find(key);
        if (it == params.end() || !it->is_number())
            return std::nullopt;
        return it->get<double>();
    }

    auto isComplete(double progress, std::optional<double> total) -> bool
    {
        if (total)
            return progress >= *total;
        return progress == 100.0;
    }

} // namespace

struct NotificationManager::Impl
{
    std::size_t maxHistorySize;

    mutable std::shared_mutex historyMutex;
    std::deque<Notification> history;

    mutable std::shared_mutex progressMutex;
    std::map<ProgressKey, ProgressState> progress;

    EventChannel<NotificationEvent> events { 256 };

    void append(Notification notification)
    {
        auto lock = std::unique_lock(historyMutex);
        history.push_back(std::move(notification));
        while (history.size() > maxHistorySize)
            history.pop_front();
    }

    void handleProgress(std::string_view serverName, const nlohmann::json& params)
    {
        auto const token = tokenOf(params);
        auto const value = numberOf(params, "progress").value_or(0.0);
        auto const total = numberOf(params, "total");
        auto const key = progressKey(serverName, token);
        auto const now = std::chrono::steady_clock::now();
        auto const complete = isComplete(value, total);

        {
            auto lock = std::unique_lock(progressMutex);
            if (complete)
            {
                progress.erase(key);
            }
            else
            {
                auto const it = progress.find(key);
                auto const startTime = it != progress.end() ? it->second.startTime : now;
                progress[key] = ProgressState {
                    .serverName = std::string(serverName),
                    .token = token,
                    .progress = value,
                    .total = total,
                    .startTime = startTime,
                    .lastUpdate = now,
                };
            }
        }

        events.publish(NotificationEvent {
            .kind = NotificationEvent::Kind::Progress,
            .serverName = std::string(serverName),
            .token = token,
            .progress = value,
            .total = total,
        });

        if (complete)
        {
            log::debug("Progress {} on '{}' complete", token, serverName);
            events.publish(NotificationEvent {
                .kind = NotificationEvent::Kind::ProgressComplete,
                .serverName = std::string(serverName),
                .token = token,
                .progress = value,
                .total = total,
            });
        }
    }

    void handleCancelled(std::string_view serverName, const nlohmann::json& params)
    {
        auto requestId = std::string("unknown");
        if (auto const it = params.find("requestId"); it != params.end())
        {
            if (it->is_string())
                requestId = it->get<std::string>();
            else if (it->is_number())
                requestId = it->dump();
        }

        auto reason = std::optional<std::string> {};
        if (auto const it = params.find("reason"); it != params.end() && it->is_string())
            reason = it->get<std::string>();

        events.publish(NotificationEvent {
            .kind = NotificationEvent::Kind::Cancelled,
            .serverName = std::string(serverName),
            .requestId = std::move(requestId),
            .reason = std::move(reason),
        });
    }
};

NotificationManager::NotificationManager(std::size_t maxHistorySize): _impl(std::make_unique<Impl>())
{
    _impl->maxHistorySize = maxHistorySize;
}

NotificationManager::~NotificationManager() = default;

auto NotificationManager::subscribe() -> EventChannel<NotificationEvent>::Receiver
{
    return _impl->events.subscribe();
}

auto NotificationManager::classify(std::string_view method) -> NotificationType
{
    if (method == "notifications/progress")
        return NotificationType::Progress;
    if (method == "notifications/cancelled")
        return NotificationType::Cancelled;
    if (method == "notifications/resources/list_changed")
        return NotificationType::ResourcesListChanged;
    if (method == "notifications/resources/updated")
        return NotificationType::ResourcesUpdated;
    if (method == "notifications/tools/list_changed")
        return NotificationType::ToolsListChanged;
    if (method == "notifications/prompts/list_changed")
        return NotificationType::PromptsListChanged;
    if (method.find("roots/list_changed") != std::string_view::npos)
        return NotificationType::RootsListChanged;
    return NotificationType::Custom;
}

void NotificationManager::handleNotification(std::string_view serverName,
                                             std::string_view method,
                                             const nlohmann::json& params)
{
    auto const type = classify(method);
    auto const& args = params.is_object() ? params : nlohmann::json::object();

    auto notification = Notification {
        .type = type,
        .serverName = std::string(serverName),
        .timestamp = std::chrono::system_clock::now(),
        .method = std::string(method),
        .params = params,
    };

    log::trace("Notification from '{}': {}", serverName, method);

    _impl->append(notification);
    _impl->events.publish(NotificationEvent {
        .kind = NotificationEvent::Kind::Notification,
        .serverName = std::string(serverName),
        .notification = std::move(notification),
    });

    switch (type)
    {
        case NotificationType::Progress:
            if (params.is_object())
                _impl->handleProgress(serverName, args);
            break;
        case NotificationType::Cancelled:
            if (params.is_object())
                _impl->handleCancelled(serverName, args);
            break;
        case NotificationType::ResourcesListChanged:
        case NotificationType::ToolsListChanged:
        case NotificationType::PromptsListChanged:
        case NotificationType::RootsListChanged:
            _impl->events.publish(NotificationEvent {
                .kind = NotificationEvent::Kind::ListChanged,
                .serverName = std::string(serverName),
                .listType = type,
            });
            break;
        case NotificationType::ResourcesUpdated:
            if (auto uri = json::getString(args, "uri"))
            {
                _impl->events.publish(NotificationEvent {
                    .kind = NotificationEvent::Kind::ResourceUpdated,
                    .serverName = std::string(serverName),
                    .uri = std::move(*uri),
                });
            }
            break;
        case NotificationType::Custom: break;
    }
}

auto NotificationManager::getHistory(const NotificationFilter& filter) const -> std::vector<Notification>
{
    auto result = std::vector<Notification> {};
    {
        auto lock = std::shared_lock(_impl->historyMutex);
        for (const auto& notification: _impl->history)
        {
            if (filter.serverName && notification.serverName != *filter.serverName)
                continue;
            if (filter.type && notification.type != *filter.type)
                continue;
            if (filter.since && notification.timestamp < *filter.since)
                continue;
            result.push_back(notification);
        }
    }

    if (filter.limit && result.size() > *filter.limit)
        result.erase(result.begin(), result.end() - static_cast<std::ptrdiff_t>(*filter.limit));

    return result;
}

void NotificationManager::clearHistory()
{
    auto count = std::size_t { 0 };
    {
        auto lock = std::unique_lock(_impl->historyMutex);
        count = _impl->history.size();
        _impl->history.clear();
    }

    _impl->events.publish(NotificationEvent {
        .kind = NotificationEvent::Kind::HistoryCleared,
        .count = count,
    });
}

auto NotificationManager::clearServerHistory(std::string_view serverName) -> std::size_t
{
    auto lock = std::unique_lock(_impl->historyMutex);
    return static_cast<std::size_t>(std::erase_if(
        _impl->history, [serverName](const Notification& notification) { return notification.serverName == serverName; }));
}

auto NotificationManager::activeProgress() const -> std::vector<ProgressState>
{
    auto lock = std::shared_lock(_impl->progressMutex);
    auto result = std::vector<ProgressState> {};
    result.reserve(_impl->progress.size());
    for (const auto& [key, state]: _impl->progress)
        result.push_back(state);
    return result;
}

auto NotificationManager::serverProgress(std::string_view serverName) const -> std::vector<ProgressState>
{
    auto lock = std::shared_lock(_impl->progressMutex);
    auto result = std::vector<ProgressState> {};
    for (const auto& [key, state]: _impl->progress)
    {
        if (state.serverName == serverName)
            result.push_back(state);
    }
    return result;
}

auto NotificationManager::cancelProgress(std::string_view serverName, std::string_view token) -> bool
{
    auto lock = std::unique_lock(_impl->progressMutex);
    return _impl->progress.erase(progressKey(serverName, token)) > 0;
}

void NotificationManager::clearProgress()
{
    auto lock = std::unique_lock(_impl->progressMutex);
    _impl->progress.clear();
}

auto NotificationManager::stats() const -> NotificationStats
{
    auto stats = NotificationStats { .maxHistorySize = _impl->maxHistorySize };
    {
        auto lock = std::shared_lock(_impl->historyMutex);
        stats.totalNotifications = _impl->history.size();
        for (const auto& notification: _impl->history)
        {
            ++stats.byType[notification.type];
            ++stats.byServer[notification.serverName];
        }
    }
    {
        auto lock = std::shared_lock(_impl->progressMutex);
        stats.activeProgress = _impl->progress.size();
    }
    return stats;
}

} // namespace mcprt
