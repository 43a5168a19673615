// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/EventChannel.hpp>
#include <core/Types.hpp>
#include <mcp/JsonRpc.hpp>
#include <mcp/Transport.hpp>
#include <mcp/TransportFactory.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcprt
{

/// @brief Event published whenever a supervised server changes state or is probed.
struct LifecycleEvent
{
    enum class Kind : std::uint8_t
    {
        Starting,
        Started,
        Stopping,
        Stopped,
        Error,
        Crashed,
        Restarting,
        HealthOk,
        HealthFailed,
    };

    Kind kind = Kind::Starting;
    std::string serverName;

    /// @brief Process id, for Started.
    std::optional<int> pid;

    /// @brief Stop reason, error message or crash cause.
    std::optional<std::string> reason;

    /// @brief Restart attempt number (1-based), for Restarting.
    int attempt = 0;

    /// @brief Probe outcome, for HealthOk and HealthFailed.
    std::optional<HealthCheckResult> health;
};

struct StartOptions
{
    /// @brief Restart the server even if it is already running.
    bool force = false;
};

struct StopOptions
{
    /// @brief Kill the process without waiting for it to exit on its own.
    bool force = false;
    std::optional<std::string> reason;
};

/// @brief Receives every notification and server-initiated request read from a server.
using MessageHandler = std::function<void(std::string_view serverName, const jsonrpc::Message& message)>;

/// @brief Supervises the servers of one runtime instance.
///
/// Each registered server owns at most one live transport. While a server is running, a
/// supervisor thread forwards its inbound messages to the message handler, probes it
/// periodically and restarts it with exponential backoff after an unexpected disconnect.
/// A server that exhausts its restart budget ends up Crashed and stays there until it is
/// restarted explicitly.
class LifecycleManager
{
  public:
    /// @brief Upper bound of the restart backoff.
    static constexpr auto MaxRestartDelay = std::chrono::milliseconds(60'000);

    /// @brief Constructs a manager.
    /// @param options Timeouts and restart budget shared by all servers.
    /// @param factory Creates the transport of a server; defaults to createTransport().
    explicit LifecycleManager(LifecycleOptions options = {}, TransportFactory factory = {});
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    /// @brief Registers a server or replaces the configuration of a registered one.
    ///
    /// A new server starts out Stopped with no restarts recorded. A running server keeps
    /// running with its previous configuration until it is restarted. The dependencies are
    /// taken from McpServerConfig::dependsOn.
    void registerServer(std::string_view name, McpServerConfig config);

    /// @brief Stops a server if it is running and forgets it. Unknown names are ignored.
    auto unregisterServer(std::string_view name) -> VoidResult;

    /// @brief Replaces the dependencies of a registered server.
    auto setDependencies(std::string_view name, std::vector<std::string> dependencies) -> VoidResult;

    /// @brief Starts a server and waits up to LifecycleOptions::startupTimeout for it to connect.
    ///
    /// Starting a running server does nothing unless StartOptions::force is set. Starting
    /// resets the restart budget.
    [[nodiscard]] auto start(std::string_view name, StartOptions options = {}) -> VoidResult;

    /// @brief Stops a server, granting it LifecycleOptions::shutdownTimeout to exit.
    [[nodiscard]] auto stop(std::string_view name, StopOptions options = {}) -> VoidResult;

    /// @brief Stops and starts a server again. This is the way out of the Crashed state.
    [[nodiscard]] auto restart(std::string_view name) -> VoidResult;

    /// @brief Starts every enabled server, dependencies before dependents.
    ///
    /// A server whose dependencies did not reach Running is skipped. Servers that failed
    /// or were skipped are reported together in one LifecycleError after all others started.
    /// @return ConfigError if the dependencies form a cycle.
    [[nodiscard]] auto startAll() -> VoidResult;

    /// @brief Stops every server, dependents before dependencies.
    [[nodiscard]] auto stopAll(bool force = false) -> VoidResult;

    /// @brief Stops and starts all servers in dependency order.
    [[nodiscard]] auto restartAll() -> VoidResult;

    /// @brief Starts a server after starting everything it depends on, transitively.
    [[nodiscard]] auto startWithDependencies(std::string_view name) -> VoidResult;

    /// @brief Returns all registered server names with dependencies ahead of their dependents.
    ///
    /// Dependencies on unregistered servers are ignored. Ties are broken by name.
    /// @return The order, or ConfigError if the dependencies form a cycle.
    [[nodiscard]] auto startOrder() const -> Result<std::vector<std::string>>;

    /// @brief Probes a server once, without touching its failure counters.
    [[nodiscard]] auto healthCheck(std::string_view name) -> HealthCheckResult;

    [[nodiscard]] auto healthCheckAll() -> std::map<std::string, HealthCheckResult>;

    /// @brief Returns the state of a server; unknown servers are reported as Stopped.
    [[nodiscard]] auto getState(std::string_view name) const -> ServerState;

    [[nodiscard]] auto getProcess(std::string_view name) const -> std::optional<ServerProcess>;

    /// @brief Returns the bookkeeping of all servers, sorted by name.
    [[nodiscard]] auto getAllProcesses() const -> std::vector<ServerProcess>;

    [[nodiscard]] auto getConfig(std::string_view name) const -> std::optional<McpServerConfig>;
    [[nodiscard]] auto getDependencies(std::string_view name) const -> std::vector<std::string>;

    [[nodiscard]] auto isRunning(std::string_view name) const -> bool;
    [[nodiscard]] auto runningServers() const -> std::vector<std::string>;
    [[nodiscard]] auto serverNames() const -> std::vector<std::string>;

    /// @brief Returns the backoff before restart attempt @p attempt (0-based).
    ///
    /// The delay is restartDelay * 2^attempt, with the exponent capped at 10 and the
    /// result capped at MaxRestartDelay.
    [[nodiscard]] auto calculateRestartDelay(int attempt) const -> std::chrono::milliseconds;

    /// @brief Returns the live transport of a server, or nullptr if it is not connected.
    [[nodiscard]] auto transport(std::string_view name) const -> std::shared_ptr<Transport>;

    /// @brief Installs the receiver of inbound notifications and server-initiated requests.
    void setMessageHandler(MessageHandler handler);

    [[nodiscard]] auto subscribe() -> EventChannel<LifecycleEvent>::Receiver;

    [[nodiscard]] auto options() const -> const LifecycleOptions&;

    /// @brief Force-stops every server and forgets all of them.
    void cleanup();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcprt
