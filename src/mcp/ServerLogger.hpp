// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcprt
{

/// @brief A log message emitted by a server through "notifications/message".
struct ServerLogEntry
{
    std::string serverName;
    ServerLogLevel level = ServerLogLevel::Info;
    std::string message;
    nlohmann::json data;
    std::optional<std::string> logger;
};

/// @brief Forwards server log messages into the application log, filtered per server.
class ServerLogger
{
  public:
    using Callback = std::function<void(const ServerLogEntry& entry)>;

    explicit ServerLogger(ServerLogLevel defaultLevel = ServerLogLevel::Info);
    ~ServerLogger();

    ServerLogger(const ServerLogger&) = delete;
    ServerLogger& operator=(const ServerLogger&) = delete;

    void setServerLevel(std::string_view serverName, ServerLogLevel level);
    void removeServerLevel(std::string_view serverName);

    /// @brief Returns the level configured for a server, falling back to the default level.
    [[nodiscard]] auto serverLevel(std::string_view serverName) const -> ServerLogLevel;

    void setDefaultLevel(ServerLogLevel level);
    [[nodiscard]] auto defaultLevel() const -> ServerLogLevel;

    void setEnabled(bool enabled);
    [[nodiscard]] auto isEnabled() const -> bool;

    /// @brief Registers a callback that receives every entry that passes the level filter.
    void onLog(Callback callback);

    /// @brief Logs an entry if it passes the server's level filter.
    /// @return true if the entry was forwarded.
    auto log(const ServerLogEntry& entry) -> bool;

    /// @brief Decodes the parameters of a "notifications/message" notification and logs them.
    /// @return true if the entry was forwarded.
    auto handleLogNotification(std::string_view serverName, const nlohmann::json& params) -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcprt
