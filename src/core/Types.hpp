// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcprt
{

/// @brief Wall-clock time point used for timestamps shown to the host.
using Timestamp = std::chrono::system_clock::time_point;

/// @brief Wire format used to reach a server.
enum class TransportType : std::uint8_t
{
    Stdio,
    Http,
    Sse,
    WebSocket,
};

/// @brief Converts a TransportType to its configuration name.
[[nodiscard]] constexpr auto transportTypeName(TransportType type) -> std::string_view
{
    switch (type)
    {
        case TransportType::Stdio: return "stdio";
        case TransportType::Http: return "http";
        case TransportType::Sse: return "sse";
        case TransportType::WebSocket: return "websocket";
    }
    return "unknown";
}

/// @brief Parses a configuration name into a TransportType.
/// @return The transport type, or std::nullopt for an unknown name.
[[nodiscard]] constexpr auto parseTransportType(std::string_view name) -> std::optional<TransportType>
{
    if (name == "stdio")
        return TransportType::Stdio;
    if (name == "http")
        return TransportType::Http;
    if (name == "sse")
        return TransportType::Sse;
    if (name == "websocket" || name == "ws")
        return TransportType::WebSocket;
    return std::nullopt;
}

/// @brief Supervision state of a registered server.
///
/// Crashed is terminal until an explicit restart is requested.
enum class ServerState : std::uint8_t
{
    Stopped,
    Starting,
    Running,
    Stopping,
    Error,
    Crashed,
};

/// @brief Converts a ServerState to a lowercase display name.
[[nodiscard]] constexpr auto serverStateName(ServerState state) -> std::string_view
{
    switch (state)
    {
        case ServerState::Stopped: return "stopped";
        case ServerState::Starting: return "starting";
        case ServerState::Running: return "running";
        case ServerState::Stopping: return "stopping";
        case ServerState::Error: return "error";
        case ServerState::Crashed: return "crashed";
    }
    return "unknown";
}

/// @brief Severity of log messages emitted by a server (the protocol's logging levels, reduced).
enum class ServerLogLevel : std::uint8_t
{
    Debug,
    Info,
    Warn,
    Error,
};

/// @brief Parses a server log level name. Unknown names map to Info.
///
/// Accepts the protocol's syslog-style names ("notice", "critical", ...) as well.
[[nodiscard]] constexpr auto parseServerLogLevel(std::string_view name) -> ServerLogLevel
{
    if (name == "debug")
        return ServerLogLevel::Debug;
    if (name == "warn" || name == "warning" || name == "notice")
        return ServerLogLevel::Warn;
    if (name == "error" || name == "critical" || name == "alert" || name == "emergency")
        return ServerLogLevel::Error;
    return ServerLogLevel::Info;
}

/// @brief Converts a ServerLogLevel to its configuration name.
[[nodiscard]] constexpr auto serverLogLevelName(ServerLogLevel level) -> std::string_view
{
    switch (level)
    {
        case ServerLogLevel::Debug: return "debug";
        case ServerLogLevel::Info: return "info";
        case ServerLogLevel::Warn: return "warn";
        case ServerLogLevel::Error: return "error";
    }
    return "info";
}

/// @brief Configuration for a single MCP server.
struct McpServerConfig
{
    TransportType transportType = TransportType::Stdio;

    // stdio
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string cwd;

    // http, sse, websocket
    std::string url;
    std::map<std::string, std::string> headers;

    bool enabled = true;
    std::chrono::milliseconds timeout = std::chrono::seconds(30);
    int retries = 3;
    std::vector<std::string> autoApprove;
    ServerLogLevel logLevel = ServerLogLevel::Info;

    /// @brief Names of servers that must be running before this one is started.
    std::vector<std::string> dependsOn;
};

/// @brief Tunables of the lifecycle supervisor, shared by all servers of one runtime instance.
struct LifecycleOptions
{
    std::chrono::milliseconds startupTimeout = std::chrono::seconds(30);
    std::chrono::milliseconds shutdownTimeout = std::chrono::seconds(10);
    int maxRestarts = 3;
    std::chrono::milliseconds restartDelay = std::chrono::seconds(1);
    std::chrono::milliseconds healthCheckInterval = std::chrono::seconds(30);
    int maxConsecutiveFailures = 3;

    /// @brief Restart servers automatically after an unexpected disconnect or failed health check.
    bool autoRestart = true;

    /// @brief Run periodic health checks while a server is running.
    bool healthChecks = true;

    /// @brief Send a protocol "ping" request as part of each health check.
    bool pingOnHealthCheck = false;
};

/// @brief Runtime bookkeeping for one registered server.
struct ServerProcess
{
    std::string name;
    std::optional<int> pid;
    ServerState state = ServerState::Stopped;
    std::optional<Timestamp> startedAt;
    std::optional<Timestamp> stoppedAt;
    int restartCount = 0;
    int consecutiveFailures = 0;
    std::optional<std::string> lastError;
};

/// @brief Outcome of a single health probe.
struct HealthCheckResult
{
    bool healthy = false;
    std::optional<std::chrono::milliseconds> latency;
    Timestamp lastCheck;
    std::optional<std::string> error;
};

} // namespace mcprt
