// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/CancellationManager.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/LifecycleManager.hpp>
#include <mcp/NotificationManager.hpp>
#include <mcp/ServerLogger.hpp>
#include <mcp/TransportFactory.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcprt
{

/// @brief MCP server capabilities reported during initialization.
struct McpServerCapabilities
{
    bool hasTools = false;
    bool hasResources = false;
    bool hasPrompts = false;
    bool hasLogging = false;
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion;
};

struct McpClientOptions
{
    LifecycleOptions lifecycle;
    std::size_t notificationHistorySize = NotificationManager::DefaultHistorySize;

    /// @brief Level below which server log messages are discarded, unless configured per server.
    ServerLogLevel serverLogLevel = ServerLogLevel::Info;

    /// @brief Perform the initialize handshake whenever a server (re)connects.
    bool initialize = true;

    std::string clientName = "mcprt";
    std::string clientVersion = "0.1.0";
    std::string protocolVersion = "2024-11-05";
};

struct RequestOptions
{
    /// @brief Overrides the server's configured request timeout.
    std::optional<std::chrono::milliseconds> timeout;

    /// @brief Overrides the generated request id.
    std::optional<std::string> id;
};

/// @brief Answers requests a server sends to the client. Returns the result or an error.
using ServerRequestHandler =
    std::function<Result<nlohmann::json>(std::string_view serverName, const jsonrpc::Request& request)>;

/// @brief Client for the Model Context Protocol (MCP).
///
/// Ties the runtime together: servers are supervised by a LifecycleManager, every
/// outbound request is tracked by a CancellationManager, and inbound notifications are
/// routed to the NotificationManager, or to the ServerLogger for log messages.
class McpClient
{
  public:
    /// @brief Constructs a client.
    /// @param options Runtime options.
    /// @param factory Creates server transports; defaults to createTransport().
    explicit McpClient(McpClientOptions options = {}, TransportFactory factory = {});
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    /// @brief Registers a server. Its dependencies are taken from McpServerConfig::dependsOn.
    void addServer(std::string_view name, McpServerConfig config);

    /// @brief Cancels the server's requests, stops it and forgets it.
    auto removeServer(std::string_view name) -> VoidResult;

    /// @brief Starts a server and performs the initialize handshake.
    [[nodiscard]] auto startServer(std::string_view name) -> VoidResult;

    /// @brief Cancels the server's requests and stops it.
    [[nodiscard]] auto stopServer(std::string_view name) -> VoidResult;

    /// @brief Starts all servers in dependency order and initializes those that are running.
    [[nodiscard]] auto startAll() -> VoidResult;

    /// @brief Cancels all requests and stops all servers in reverse dependency order.
    [[nodiscard]] auto stopAll() -> VoidResult;

    /// @brief Performs the MCP initialize handshake with a running server.
    /// @return The server's capabilities or an error.
    [[nodiscard]] auto initialize(std::string_view serverName) -> Result<McpServerCapabilities>;

    /// @brief Returns the capabilities of an initialized server.
    [[nodiscard]] auto capabilities(std::string_view serverName) const -> std::optional<McpServerCapabilities>;

    /// @brief Sends a request and waits for its result.
    ///
    /// The request can be cancelled through cancel() while it is in flight. A request that
    /// times out or is cancelled is abandoned on the server with "notifications/cancelled".
    /// @return The result member of the response, or an error. A JSON-RPC error returned by
    ///         the server becomes a ServerError carrying the server's code.
    [[nodiscard]] auto request(std::string_view serverName,
                               std::string_view method,
                               nlohmann::json params = nullptr,
                               RequestOptions options = {}) -> Result<nlohmann::json>;

    /// @brief Sends a notification to a server.
    [[nodiscard]] auto notify(std::string_view serverName, std::string_view method, nlohmann::json params = nullptr)
        -> VoidResult;

    /// @brief Cancels an in-flight request.
    /// @return The result, or std::nullopt if no such request is in flight.
    auto cancel(std::string_view requestId, CancellationReason reason = CancellationReason::UserCancelled)
        -> std::optional<CancellationResult>;

    /// @brief Installs the handler for requests sent by servers. "ping" is always answered.
    void setRequestHandler(ServerRequestHandler handler);

    [[nodiscard]] auto lifecycle() -> LifecycleManager&;
    [[nodiscard]] auto cancellations() -> CancellationManager&;
    [[nodiscard]] auto notifications() -> NotificationManager&;
    [[nodiscard]] auto serverLogger() -> ServerLogger&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcprt
