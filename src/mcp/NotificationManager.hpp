// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/EventChannel.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcprt
{

/// @brief Classification of inbound server notifications.
enum class NotificationType : std::uint8_t
{
    Progress,
    Cancelled,
    ResourcesListChanged,
    ResourcesUpdated,
    ToolsListChanged,
    PromptsListChanged,
    RootsListChanged,
    Custom,
};

/// @brief Returns the short name of a notification type, e.g. "tools/list_changed".
[[nodiscard]] constexpr auto notificationTypeName(NotificationType type) -> std::string_view
{
    switch (type)
    {
        case NotificationType::Progress: return "progress";
        case NotificationType::Cancelled: return "cancelled";
        case NotificationType::ResourcesListChanged: return "resources/list_changed";
        case NotificationType::ResourcesUpdated: return "resources/updated";
        case NotificationType::ToolsListChanged: return "tools/list_changed";
        case NotificationType::PromptsListChanged: return "prompts/list_changed";
        case NotificationType::RootsListChanged: return "roots/list_changed";
        case NotificationType::Custom: return "custom";
    }
    return "custom";
}

/// @brief Immutable record of one received notification.
struct Notification
{
    NotificationType type = NotificationType::Custom;
    std::string serverName;
    Timestamp timestamp;
    std::string method;
    nlohmann::json params;
};

/// @brief Progress of one long-running operation, keyed by (server, progress token).
struct ProgressState
{
    std::string serverName;
    std::string token;
    double progress = 0.0;
    std::optional<double> total;
    std::chrono::steady_clock::time_point startTime;
    std::chrono::steady_clock::time_point lastUpdate;
};

/// @brief Event published by the NotificationManager.
struct NotificationEvent
{
    enum class Kind : std::uint8_t
    {
        Notification,
        Progress,
        ProgressComplete,
        Cancelled,
        ListChanged,
        ResourceUpdated,
        HistoryCleared,
    };

    Kind kind = Kind::Notification;
    std::string serverName;

    /// @brief The full record, for Kind::Notification.
    std::optional<mcprt::Notification> notification;

    // Progress, ProgressComplete
    std::string token;
    double progress = 0.0;
    std::optional<double> total;

    // Cancelled
    std::string requestId;
    std::optional<std::string> reason;

    // ListChanged
    NotificationType listType = NotificationType::Custom;

    // ResourceUpdated
    std::string uri;

    // HistoryCleared
    std::size_t count = 0;
};

/// @brief Criteria for NotificationManager::getHistory(). Unset members match everything.
struct NotificationFilter
{
    std::optional<std::string> serverName;
    std::optional<NotificationType> type;
    std::optional<Timestamp> since;

    /// @brief Maximum number of results; the most recent entries are kept.
    std::optional<std::size_t> limit;
};

/// @brief Summary of the notification history.
struct NotificationStats
{
    std::size_t totalNotifications = 0;
    std::size_t maxHistorySize = 0;
    std::size_t activeProgress = 0;
    std::map<NotificationType, std::size_t> byType;
    std::map<std::string, std::size_t> byServer;
};

/// @brief Classifies server notifications, keeps a bounded history and tracks active progress.
class NotificationManager
{
  public:
    static constexpr auto DefaultHistorySize = std::size_t { 100 };

    /// @brief Constructs a NotificationManager.
    /// @param maxHistorySize Capacity of the history; the oldest entries are evicted first.
    explicit NotificationManager(std::size_t maxHistorySize = DefaultHistorySize);
    ~NotificationManager();

    NotificationManager(const NotificationManager&) = delete;
    NotificationManager& operator=(const NotificationManager&) = delete;

    /// @brief Subscribes to notification events.
    [[nodiscard]] auto subscribe() -> EventChannel<NotificationEvent>::Receiver;

    /// @brief Maps a method name onto the notification taxonomy.
    [[nodiscard]] static auto classify(std::string_view method) -> NotificationType;

    /// @brief Records a notification and publishes the events derived from it.
    /// @param serverName The server that sent the notification.
    /// @param method The notification method.
    /// @param params The notification parameters (may be null).
    void handleNotification(std::string_view serverName, std::string_view method, const nlohmann::json& params);

    /// @brief Returns the history, oldest first, filtered by @p filter.
    [[nodiscard]] auto getHistory(const NotificationFilter& filter = {}) const -> std::vector<Notification>;

    /// @brief Clears the whole history and publishes a HistoryCleared event.
    void clearHistory();

    /// @brief Removes the history entries of one server.
    /// @return The number of removed entries.
    auto clearServerHistory(std::string_view serverName) -> std::size_t;

    [[nodiscard]] auto activeProgress() const -> std::vector<ProgressState>;
    [[nodiscard]] auto serverProgress(std::string_view serverName) const -> std::vector<ProgressState>;

    /// @brief Stops tracking one progress token.
    /// @return true if the token was tracked.
    auto cancelProgress(std::string_view serverName, std::string_view token) -> bool;

    void clearProgress();

    [[nodiscard]] auto stats() const -> NotificationStats;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcprt
