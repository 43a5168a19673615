// SPDX-License-Identifier: Apache-2.0
#include "LifecycleManager.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <thread>

namespace mcprt
{

namespace
{

    /// @brief Upper bound on how long a supervisor takes to notice a stop request.
    constexpr auto SupervisorPollInterval = std::chrono::milliseconds(50);

    auto lifecycleError(std::string_view serverName, std::string message) -> std::unexpected<Error>
    {
        auto error = Error { .code = ErrorCode::LifecycleError, .message = std::move(message) };
        error.data = nlohmann::json { { "server", std::string(serverName) } };
        return std::unexpected<Error>(std::move(error));
    }

    auto join(const std::vector<std::string>& items, std::string_view separator) -> std::string
    {
        auto result = std::string {};
        for (const auto& item: items)
        {
            if (!result.empty())
                result += separator;
            result += item;
        }
        return result;
    }

    using DependencyGraph = std::map<std::string, std::vector<std::string>, std::less<>>;

    /// @brief Depth-first topological sort starting at @p roots; unknown nodes are skipped.
    auto sortTopologically(const DependencyGraph& graph, const std::vector<std::string>& roots)
        -> Result<std::vector<std::string>>
    {
        enum class Mark : std::uint8_t
        {
            Visiting,
            Done,
        };

        auto marks = std::map<std::string, Mark, std::less<>> {};
        auto order = std::vector<std::string> {};
        auto path = std::vector<std::string> {};

        std::function<VoidResult(const std::string&)> visit = [&](const std::string& name) -> VoidResult {
            auto const node = graph.find(name);
            if (node == graph.end())
                return {};

            if (auto const it = marks.find(name); it != marks.end())
            {
                if (it->second == Mark::Done)
                    return {};

                auto cycle = std::vector<std::string>(std::ranges::find(path, name), path.end());
                cycle.push_back(name);
                return makeError(ErrorCode::ConfigError,
                                 std::format("Dependency cycle detected: {}", join(cycle, " -> ")));
            }

            marks[name] = Mark::Visiting;
            path.push_back(name);
            for (const auto& dependency: node->second)
            {
                if (auto result = visit(dependency); !result)
                    return result;
            }
            path.pop_back();
            marks[name] = Mark::Done;
            order.push_back(name);
            return {};
        };

        for (const auto& root: roots)
        {
            if (auto result = visit(root); !result)
                return std::unexpected(result.error());
        }
        return order;
    }

    /// @brief A connected transport together with the subscription opened before connecting.
    struct Connection
    {
        std::shared_ptr<Transport> transport;
        EventChannel<TransportEvent>::Receiver receiver;
    };

    struct ManagedServer
    {
        explicit ManagedServer(std::string serverName): name(std::move(serverName)) { process.name = name; }

        std::string const name;

        /// @brief Serializes start, stop and restart of this server. Taken before Impl::mutex.
        std::mutex operationMutex;

        // Guarded by Impl::mutex.
        ServerProcess process;
        McpServerConfig config;
        std::vector<std::string> dependencies;
        std::shared_ptr<Transport> transport;

        // Guarded by operationMutex.
        std::jthread supervisor;
    };

    /// @brief A health probe running beside the event pump.
    ///
    /// Destroying it cancels the ping and waits for the probe to return.
    struct PendingProbe
    {
        CancellationToken token;
        std::future<HealthCheckResult> result;

        PendingProbe() = default;
        PendingProbe(const PendingProbe&) = delete;
        auto operator=(const PendingProbe&) -> PendingProbe& = delete;

        ~PendingProbe()
        {
            token.cancel(CancellationReason::Shutdown);
            if (result.valid())
                result.wait();
        }
    };

} // namespace

struct LifecycleManager::Impl
{
    LifecycleOptions options;
    TransportFactory factory;

    mutable std::shared_mutex mutex;
    std::map<std::string, std::shared_ptr<ManagedServer>, std::less<>> servers;

    std::mutex handlerMutex;
    MessageHandler messageHandler;

    std::mutex sleepMutex;
    std::condition_variable_any sleepCv;

    std::atomic<std::int64_t> nextPingId { 1 };

    EventChannel<LifecycleEvent> events { 256 };

    [[nodiscard]] auto find(std::string_view name) const -> std::shared_ptr<ManagedServer>
    {
        auto lock = std::shared_lock(mutex);
        auto const it = servers.find(name);
        return it != servers.end() ? it->second : nullptr;
    }

    [[nodiscard]] auto stateOf(std::string_view name) const -> ServerState
    {
        auto lock = std::shared_lock(mutex);
        auto const it = servers.find(name);
        return it != servers.end() ? it->second->process.state : ServerState::Stopped;
    }

    [[nodiscard]] auto dependencyGraph() const -> DependencyGraph
    {
        auto lock = std::shared_lock(mutex);
        auto graph = DependencyGraph {};
        for (const auto& [name, server]: servers)
            graph.emplace(name, server->dependencies);
        return graph;
    }

    void publish(LifecycleEvent::Kind kind,
                 std::string_view serverName,
                 std::optional<std::string> reason = std::nullopt)
    {
        events.publish(LifecycleEvent {
            .kind = kind,
            .serverName = std::string(serverName),
            .reason = std::move(reason),
        });
    }

    [[nodiscard]] auto restartDelay(int attempt) const -> std::chrono::milliseconds
    {
        auto const base = std::max(options.restartDelay, std::chrono::milliseconds::zero());
        if (base >= LifecycleManager::MaxRestartDelay)
            return LifecycleManager::MaxRestartDelay;

        auto const exponent = std::clamp(attempt, 0, 10);
        return std::min(base * (std::int64_t { 1 } << exponent), LifecycleManager::MaxRestartDelay);
    }

    void dispatch(std::string_view serverName, const jsonrpc::Message& message)
    {
        auto handler = MessageHandler {};
        {
            auto lock = std::lock_guard(handlerMutex);
            handler = messageHandler;
        }
        if (handler)
            handler(serverName, message);
    }

    /// @brief Sleeps for @p delay unless a stop is requested first.
    /// @return false if the sleep was interrupted.
    auto sleepFor(const std::stop_token& stop, std::chrono::milliseconds delay) -> bool
    {
        auto lock = std::unique_lock(sleepMutex);
        sleepCv.wait_for(lock, stop, delay, [] { return false; });
        return !stop.stop_requested();
    }

    auto waitConnected(std::string_view serverName, Transport& transport, EventChannel<TransportEvent>::Receiver& receiver)
        -> VoidResult
    {
        auto const deadline = std::chrono::steady_clock::now() + options.startupTimeout;
        while (true)
        {
            auto event = receiver.tryReceive();
            if (!event)
            {
                if (transport.isConnected())
                    return {};

                auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining <= std::chrono::milliseconds::zero())
                {
                    return makeError(ErrorCode::TimeoutError,
                                     std::format("Server '{}' did not connect within {}ms",
                                                 serverName,
                                                 options.startupTimeout.count()));
                }

                event = receiver.receive(std::min(remaining, SupervisorPollInterval));
                if (!event)
                    continue;
            }

            switch (event->kind)
            {
                case TransportEvent::Kind::Connected: return {};
                case TransportEvent::Kind::Disconnected:
                case TransportEvent::Kind::Error:
                    return makeError(ErrorCode::ConnectionError,
                                     event->reason.empty() ? "Transport closed during startup" : event->reason);
                case TransportEvent::Kind::MessageReceived:
                    if (event->message)
                        dispatch(serverName, *event->message);
                    break;
                case TransportEvent::Kind::Connecting: break;
            }
        }
    }

    auto openConnection(std::string_view serverName, const McpServerConfig& config) -> Result<Connection>
    {
        auto created = factory(serverName, config);
        if (!created)
            return std::unexpected(created.error());

        auto transport = std::shared_ptr<Transport>(std::move(*created));
        if (!transport)
            return makeError(ErrorCode::ConfigError, "Transport factory returned no transport");

        auto receiver = transport->subscribe();
        if (auto connected = transport->connect(); !connected)
            return std::unexpected(connected.error());

        if (auto ready = waitConnected(serverName, *transport, receiver); !ready)
        {
            transport->terminate();
            return std::unexpected(ready.error());
        }

        return Connection { .transport = std::move(transport), .receiver = std::move(receiver) };
    }

    auto probe(Transport& transport, std::chrono::milliseconds timeout, CancellationToken token = {})
        -> HealthCheckResult
    {
        auto const started = std::chrono::steady_clock::now();
        auto result = HealthCheckResult { .lastCheck = std::chrono::system_clock::now() };
        auto elapsed = [&] {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        };

        if (!transport.isConnected())
        {
            result.error = "Transport is not connected";
            return result;
        }

        if (options.pingOnHealthCheck)
        {
            auto const request = jsonrpc::Request {
                .id = std::format("health-{}", nextPingId++),
                .method = "ping",
                .params = nullptr,
            };

            // Any response, even an error response, proves the server is alive.
            auto response = transport.sendRequest(request, timeout, std::move(token));
            if (!response)
            {
                result.latency = elapsed();
                result.error = std::format("Ping failed: {}", response.error().message);
                return result;
            }
        }

        result.healthy = true;
        result.latency = elapsed();
        return result;
    }

    void stopSupervisor(ManagedServer& server)
    {
        if (!server.supervisor.joinable())
            return;
        server.supervisor.request_stop();
        server.supervisor.join();
    }

    auto startLocked(ManagedServer& server, const StartOptions& startOptions) -> VoidResult
    {
        auto config = McpServerConfig {};
        auto state = ServerState::Stopped;
        {
            auto lock = std::shared_lock(mutex);
            state = server.process.state;
            config = server.config;
        }

        if (state == ServerState::Running && !startOptions.force)
            return {};
        if (!config.enabled)
            return lifecycleError(server.name, std::format("Server '{}' is disabled", server.name));

        if (state == ServerState::Running)
        {
            if (auto stopped = stopLocked(server, StopOptions { .reason = "Forced restart" }); !stopped)
                return stopped;
        }
        else
        {
            stopSupervisor(server);
        }

        log::info("Starting MCP server '{}'", server.name);
        publish(LifecycleEvent::Kind::Starting, server.name);
        {
            auto lock = std::unique_lock(mutex);
            server.process.state = ServerState::Starting;
        }

        auto connection = openConnection(server.name, config);
        if (!connection)
        {
            auto const message = connection.error().message;
            {
                auto lock = std::unique_lock(mutex);
                server.process.state = ServerState::Error;
                server.process.lastError = message;
                ++server.process.consecutiveFailures;
            }
            log::error("Failed to start MCP server '{}': {}", server.name, message);
            publish(LifecycleEvent::Kind::Error, server.name, message);
            return lifecycleError(server.name, std::format("Failed to start server '{}': {}", server.name, message));
        }

        auto const pid = connection->transport->processId();
        {
            auto lock = std::unique_lock(mutex);
            server.process.state = ServerState::Running;
            server.process.pid = pid;
            server.process.startedAt = std::chrono::system_clock::now();
            server.process.stoppedAt.reset();
            server.process.restartCount = 0;
            server.process.consecutiveFailures = 0;
            server.process.lastError.reset();
            server.transport = connection->transport;
        }

        log::info("MCP server '{}' is running", server.name);
        events.publish(LifecycleEvent {
            .kind = LifecycleEvent::Kind::Started,
            .serverName = server.name,
            .pid = pid,
        });

        server.supervisor = std::jthread(
            [this, &server, connection = std::move(*connection)](const std::stop_token& stop) mutable {
                supervise(stop, server, std::move(connection));
            });
        return {};
    }

    auto stopLocked(ManagedServer& server, const StopOptions& stopOptions) -> VoidResult
    {
        stopSupervisor(server);

        auto transport = std::shared_ptr<Transport> {};
        auto state = ServerState::Stopped;
        {
            auto lock = std::shared_lock(mutex);
            transport = server.transport;
            state = server.process.state;
        }

        // A crashed server keeps its state until it is restarted explicitly.
        if (!transport && (state == ServerState::Stopped || state == ServerState::Crashed))
            return {};

        log::info("Stopping MCP server '{}'{}",
                  server.name,
                  stopOptions.reason ? std::format(" ({})", *stopOptions.reason) : std::string {});
        publish(LifecycleEvent::Kind::Stopping, server.name, stopOptions.reason);
        {
            auto lock = std::unique_lock(mutex);
            server.process.state = ServerState::Stopping;
        }

        if (transport)
        {
            if (stopOptions.force)
                transport->terminate();
            else
                transport->disconnect();
        }

        {
            auto lock = std::unique_lock(mutex);
            server.process.state = ServerState::Stopped;
            server.process.pid.reset();
            server.process.stoppedAt = std::chrono::system_clock::now();
            server.transport.reset();
        }

        publish(LifecycleEvent::Kind::Stopped, server.name, stopOptions.reason);
        return {};
    }

    /// @brief Pumps inbound messages and probes the server until stopped or crashed.
    ///
    /// Pings run on their own thread so that notifications keep flowing while a probe waits.
    void supervise(const std::stop_token& stop, ManagedServer& server, Connection connection)
    {
        auto nextCheck = std::chrono::steady_clock::now() + options.healthCheckInterval;
        auto inFlight = std::optional<PendingProbe> {};

        while (!stop.stop_requested())
        {
            auto wait = SupervisorPollInterval;
            if (options.healthChecks && !inFlight)
            {
                auto const untilCheck = std::chrono::duration_cast<std::chrono::milliseconds>(
                    nextCheck - std::chrono::steady_clock::now());
                wait = std::clamp(untilCheck, std::chrono::milliseconds::zero(), SupervisorPollInterval);
            }

            if (auto event = connection.receiver.receive(wait))
            {
                if (event->kind == TransportEvent::Kind::MessageReceived)
                {
                    if (event->message)
                        dispatch(server.name, *event->message);
                }
                else if (event->kind == TransportEvent::Kind::Disconnected
                         || event->kind == TransportEvent::Kind::Error)
                {
                    if (stop.stop_requested())
                        return;

                    inFlight.reset();
                    auto const reason = event->reason.empty() ? std::string("Connection lost") : event->reason;
                    log::warning("MCP server '{}' disconnected unexpectedly: {}", server.name, reason);
                    {
                        auto lock = std::unique_lock(mutex);
                        ++server.process.consecutiveFailures;
                    }
                    if (!recover(stop, server, connection, reason))
                        return;
                    nextCheck = std::chrono::steady_clock::now() + options.healthCheckInterval;
                    continue;
                }
            }

            if (!options.healthChecks)
                continue;

            if (!inFlight)
            {
                if (std::chrono::steady_clock::now() < nextCheck)
                    continue;

                auto timeout = std::chrono::milliseconds {};
                {
                    auto lock = std::shared_lock(mutex);
                    timeout = server.config.timeout;
                }

                auto& pending = inFlight.emplace();
                pending.result = std::async(
                    std::launch::async,
                    [this, transport = connection.transport, timeout, token = pending.token]() mutable {
                        return probe(*transport, timeout, std::move(token));
                    });
                continue;
            }

            if (inFlight->result.wait_for(std::chrono::milliseconds::zero()) != std::future_status::ready)
                continue;

            auto const result = inFlight->result.get();
            inFlight.reset();
            nextCheck = std::chrono::steady_clock::now() + options.healthCheckInterval;
            if (!handleHealthResult(stop, server, connection, result))
                return;
        }
    }

    /// @brief Records the outcome of a supervisor probe and recovers the server once it has failed too often.
    /// @return false if supervision should end.
    auto handleHealthResult(const std::stop_token& stop,
                            ManagedServer& server,
                            Connection& connection,
                            const HealthCheckResult& result) -> bool
    {
        events.publish(LifecycleEvent {
            .kind = result.healthy ? LifecycleEvent::Kind::HealthOk : LifecycleEvent::Kind::HealthFailed,
            .serverName = server.name,
            .reason = result.error,
            .health = result,
        });

        if (result.healthy)
        {
            auto lock = std::unique_lock(mutex);
            server.process.consecutiveFailures = 0;
            return true;
        }

        auto failures = 0;
        {
            auto lock = std::unique_lock(mutex);
            failures = ++server.process.consecutiveFailures;
            server.process.lastError = result.error;
        }

        auto const reason = result.error.value_or("Health check failed");
        log::warning("Health check of MCP server '{}' failed ({}/{}): {}",
                     server.name,
                     failures,
                     options.maxConsecutiveFailures,
                     reason);

        if (connection.transport->isConnected() && failures < options.maxConsecutiveFailures)
            return true;

        return recover(stop, server, connection, reason);
    }

    /// @brief Replaces a failed connection, with backoff, until it succeeds or the budget is spent.
    /// @return true if @p connection holds a fresh, connected transport.
    auto recover(const std::stop_token& stop, ManagedServer& server, Connection& connection, std::string reason)
        -> bool
    {
        connection.transport->disconnect();

        while (!stop.stop_requested())
        {
            auto attempt = 0;
            auto crashReason = std::optional<std::string> {};
            auto config = McpServerConfig {};
            {
                auto lock = std::unique_lock(mutex);
                auto& process = server.process;
                process.pid.reset();

                if (!options.autoRestart)
                    crashReason = std::format("{} (automatic restart disabled)", reason);
                else if (process.restartCount >= options.maxRestarts)
                    crashReason = std::format("{} (gave up after {} restarts)", reason, process.restartCount);
                else if (process.consecutiveFailures >= options.maxConsecutiveFailures)
                    crashReason = std::format("{} ({} consecutive failures)", reason, process.consecutiveFailures);

                if (crashReason)
                {
                    process.state = ServerState::Crashed;
                    process.stoppedAt = std::chrono::system_clock::now();
                    process.lastError = crashReason;
                    server.transport.reset();
                }
                else
                {
                    process.state = ServerState::Starting;
                    process.lastError = reason;
                    attempt = process.restartCount;
                }
                config = server.config;
            }

            if (crashReason)
            {
                log::error("MCP server '{}' crashed: {}", server.name, *crashReason);
                publish(LifecycleEvent::Kind::Crashed, server.name, crashReason);
                return false;
            }

            auto const delay = restartDelay(attempt);
            log::info("Restarting MCP server '{}' in {}ms (attempt {}/{})",
                      server.name,
                      delay.count(),
                      attempt + 1,
                      options.maxRestarts);
            events.publish(LifecycleEvent {
                .kind = LifecycleEvent::Kind::Restarting,
                .serverName = server.name,
                .reason = reason,
                .attempt = attempt + 1,
            });

            if (!sleepFor(stop, delay))
                return false;

            {
                auto lock = std::unique_lock(mutex);
                ++server.process.restartCount;
            }
            publish(LifecycleEvent::Kind::Starting, server.name);

            auto next = openConnection(server.name, config);
            if (next)
            {
                auto const pid = next->transport->processId();
                connection = std::move(*next);
                {
                    auto lock = std::unique_lock(mutex);
                    server.process.state = ServerState::Running;
                    server.process.pid = pid;
                    server.process.startedAt = std::chrono::system_clock::now();
                    server.process.stoppedAt.reset();
                    server.transport = connection.transport;
                }
                log::info("MCP server '{}' is running again", server.name);
                events.publish(LifecycleEvent {
                    .kind = LifecycleEvent::Kind::Started,
                    .serverName = server.name,
                    .pid = pid,
                });
                return true;
            }

            reason = next.error().message;
            {
                auto lock = std::unique_lock(mutex);
                server.process.state = ServerState::Error;
                server.process.lastError = reason;
                ++server.process.consecutiveFailures;
            }
            log::warning("Restart of MCP server '{}' failed: {}", server.name, reason);
            publish(LifecycleEvent::Kind::Error, server.name, reason);
        }
        return false;
    }
};

LifecycleManager::LifecycleManager(LifecycleOptions options, TransportFactory factory):
    _impl(std::make_unique<Impl>())
{
    _impl->options = options;
    _impl->factory = factory ? std::move(factory) : defaultTransportFactory(options.shutdownTimeout);
}

LifecycleManager::~LifecycleManager()
{
    cleanup();
}

void LifecycleManager::registerServer(std::string_view name, McpServerConfig config)
{
    auto lock = std::unique_lock(_impl->mutex);
    auto dependencies = config.dependsOn;

    if (auto const it = _impl->servers.find(name); it != _impl->servers.end())
    {
        it->second->config = std::move(config);
        it->second->dependencies = std::move(dependencies);
        log::debug("Updated configuration of MCP server '{}'", name);
        return;
    }

    auto server = std::make_shared<ManagedServer>(std::string(name));
    server->config = std::move(config);
    server->dependencies = std::move(dependencies);
    _impl->servers.emplace(std::string(name), std::move(server));
    log::debug("Registered MCP server '{}'", name);
}

auto LifecycleManager::unregisterServer(std::string_view name) -> VoidResult
{
    auto server = _impl->find(name);
    if (!server)
        return {};

    auto opLock = std::lock_guard(server->operationMutex);
    if (auto stopped = _impl->stopLocked(*server, StopOptions { .reason = "Server unregistered" }); !stopped)
        return stopped;

    {
        auto lock = std::unique_lock(_impl->mutex);
        if (auto const it = _impl->servers.find(name); it != _impl->servers.end() && it->second == server)
            _impl->servers.erase(it);
    }
    log::debug("Unregistered MCP server '{}'", name);
    return {};
}

auto LifecycleManager::setDependencies(std::string_view name, std::vector<std::string> dependencies) -> VoidResult
{
    auto lock = std::unique_lock(_impl->mutex);
    auto const it = _impl->servers.find(name);
    if (it == _impl->servers.end())
        return lifecycleError(name, std::format("Server not registered: {}", name));

    it->second->dependencies = std::move(dependencies);
    return {};
}

auto LifecycleManager::start(std::string_view name, StartOptions options) -> VoidResult
{
    auto server = _impl->find(name);
    if (!server)
        return lifecycleError(name, std::format("Server not registered: {}", name));

    auto opLock = std::lock_guard(server->operationMutex);
    if (_impl->stateOf(name) == ServerState::Crashed)
        return lifecycleError(name, std::format("Server '{}' has crashed and must be restarted explicitly", name));

    return _impl->startLocked(*server, options);
}

auto LifecycleManager::stop(std::string_view name, StopOptions options) -> VoidResult
{
    auto server = _impl->find(name);
    if (!server)
        return lifecycleError(name, std::format("Server not registered: {}", name));

    auto opLock = std::lock_guard(server->operationMutex);
    return _impl->stopLocked(*server, options);
}

auto LifecycleManager::restart(std::string_view name) -> VoidResult
{
    auto server = _impl->find(name);
    if (!server)
        return lifecycleError(name, std::format("Server not registered: {}", name));

    auto opLock = std::lock_guard(server->operationMutex);
    if (auto stopped = _impl->stopLocked(*server, StopOptions { .reason = "Restarting" }); !stopped)
        return stopped;

    {
        auto lock = std::unique_lock(_impl->mutex);
        server->process.state = ServerState::Stopped;
        server->process.restartCount = 0;
        server->process.consecutiveFailures = 0;
    }
    return _impl->startLocked(*server, StartOptions {});
}

auto LifecycleManager::startAll() -> VoidResult
{
    auto order = startOrder();
    if (!order)
    {
        log::error("Cannot start MCP servers: {}", order.error().message);
        return std::unexpected(order.error());
    }

    auto failures = std::vector<std::string> {};
    for (const auto& name: *order)
    {
        auto server = _impl->find(name);
        if (!server)
            continue;

        auto enabled = true;
        auto dependencies = std::vector<std::string> {};
        {
            auto lock = std::shared_lock(_impl->mutex);
            enabled = server->config.enabled;
            dependencies = server->dependencies;
        }

        if (!enabled)
        {
            log::debug("Skipping disabled MCP server '{}'", name);
            continue;
        }

        auto const blocker = std::ranges::find_if(
            dependencies, [this](const std::string& dependency) { return !isRunning(dependency); });
        if (blocker != dependencies.end())
        {
            auto message = std::format("Server '{}' not started: dependency '{}' is not running", name, *blocker);
            log::warning("{}", message);
            failures.push_back(std::move(message));
            continue;
        }

        auto opLock = std::lock_guard(server->operationMutex);
        if (_impl->stateOf(name) == ServerState::Crashed)
        {
            failures.push_back(std::format("Server '{}' has crashed and must be restarted explicitly", name));
            continue;
        }
        if (auto started = _impl->startLocked(*server, StartOptions {}); !started)
            failures.push_back(started.error().message);
    }

    if (failures.empty())
        return {};

    return makeError(ErrorCode::LifecycleError,
                     std::format("Failed to start {} server(s): {}", failures.size(), join(failures, "; ")));
}

auto LifecycleManager::stopAll(bool force) -> VoidResult
{
    auto order = startOrder();
    if (!order)
    {
        // Stopping must not be blocked by a broken dependency graph.
        log::warning("Stopping MCP servers in name order: {}", order.error().message);
        order = serverNames();
    }
    std::ranges::reverse(*order);

    auto failures = std::vector<std::string> {};
    for (const auto& name: *order)
    {
        auto server = _impl->find(name);
        if (!server)
            continue;

        auto opLock = std::lock_guard(server->operationMutex);
        auto stopped =
            _impl->stopLocked(*server, StopOptions { .force = force, .reason = "Stopping all servers" });
        if (!stopped)
            failures.push_back(stopped.error().message);
    }

    if (failures.empty())
        return {};

    return makeError(ErrorCode::LifecycleError,
                     std::format("Failed to stop {} server(s): {}", failures.size(), join(failures, "; ")));
}

auto LifecycleManager::restartAll() -> VoidResult
{
    if (auto stopped = stopAll(); !stopped)
        return stopped;

    {
        auto lock = std::unique_lock(_impl->mutex);
        for (auto& [name, server]: _impl->servers)
        {
            if (server->process.state != ServerState::Crashed)
                continue;
            server->process.state = ServerState::Stopped;
            server->process.restartCount = 0;
            server->process.consecutiveFailures = 0;
        }
    }
    return startAll();
}

auto LifecycleManager::startWithDependencies(std::string_view name) -> VoidResult
{
    if (!_impl->find(name))
        return lifecycleError(name, std::format("Server not registered: {}", name));

    auto const graph = _impl->dependencyGraph();
    auto order = sortTopologically(graph, { std::string(name) });
    if (!order)
        return std::unexpected(order.error());

    for (const auto& server: *order)
    {
        for (const auto& dependency: graph.find(server)->second)
        {
            if (!graph.contains(dependency))
            {
                return lifecycleError(
                    server, std::format("Server '{}' depends on unregistered server '{}'", server, dependency));
            }
        }
    }

    for (const auto& server: *order)
    {
        if (auto started = start(server); !started)
            return started;
    }
    return {};
}

auto LifecycleManager::startOrder() const -> Result<std::vector<std::string>>
{
    auto const graph = _impl->dependencyGraph();
    auto roots = std::vector<std::string> {};
    roots.reserve(graph.size());
    for (const auto& [name, dependencies]: graph)
        roots.push_back(name);
    return sortTopologically(graph, roots);
}

auto LifecycleManager::healthCheck(std::string_view name) -> HealthCheckResult
{
    auto const now = std::chrono::system_clock::now();
    auto server = _impl->find(name);
    if (!server)
        return HealthCheckResult { .lastCheck = now, .error = "Server not found" };

    auto transport = std::shared_ptr<Transport> {};
    auto state = ServerState::Stopped;
    auto timeout = std::chrono::milliseconds {};
    {
        auto lock = std::shared_lock(_impl->mutex);
        transport = server->transport;
        state = server->process.state;
        timeout = server->config.timeout;
    }

    if (!transport || state != ServerState::Running)
        return HealthCheckResult { .lastCheck = now, .error = "Server not running" };

    return _impl->probe(*transport, timeout);
}

auto LifecycleManager::healthCheckAll() -> std::map<std::string, HealthCheckResult>
{
    auto results = std::map<std::string, HealthCheckResult> {};
    for (const auto& name: serverNames())
        results.emplace(name, healthCheck(name));
    return results;
}

auto LifecycleManager::getState(std::string_view name) const -> ServerState
{
    return _impl->stateOf(name);
}

auto LifecycleManager::getProcess(std::string_view name) const -> std::optional<ServerProcess>
{
    auto lock = std::shared_lock(_impl->mutex);
    auto const it = _impl->servers.find(name);
    if (it == _impl->servers.end())
        return std::nullopt;
    return it->second->process;
}

auto LifecycleManager::getAllProcesses() const -> std::vector<ServerProcess>
{
    auto lock = std::shared_lock(_impl->mutex);
    auto result = std::vector<ServerProcess> {};
    result.reserve(_impl->servers.size());
    for (const auto& [name, server]: _impl->servers)
        result.push_back(server->process);
    return result;
}

auto LifecycleManager::getConfig(std::string_view name) const -> std::optional<McpServerConfig>
{
    auto lock = std::shared_lock(_impl->mutex);
    auto const it = _impl->servers.find(name);
    if (it == _impl->servers.end())
        return std::nullopt;
    return it->second->config;
}

auto LifecycleManager::getDependencies(std::string_view name) const -> std::vector<std::string>
{
    auto lock = std::shared_lock(_impl->mutex);
    auto const it = _impl->servers.find(name);
    if (it == _impl->servers.end())
        return {};
    return it->second->dependencies;
}

auto LifecycleManager::isRunning(std::string_view name) const -> bool
{
    return _impl->stateOf(name) == ServerState::Running;
}

auto LifecycleManager::runningServers() const -> std::vector<std::string>
{
    auto lock = std::shared_lock(_impl->mutex);
    auto result = std::vector<std::string> {};
    for (const auto& [name, server]: _impl->servers)
    {
        if (server->process.state == ServerState::Running)
            result.push_back(name);
    }
    return result;
}

auto LifecycleManager::serverNames() const -> std::vector<std::string>
{
    auto lock = std::shared_lock(_impl->mutex);
    auto result = std::vector<std::string> {};
    result.reserve(_impl->servers.size());
    for (const auto& [name, server]: _impl->servers)
        result.push_back(name);
    return result;
}

auto LifecycleManager::calculateRestartDelay(int attempt) const -> std::chrono::milliseconds
{
    return _impl->restartDelay(attempt);
}

auto LifecycleManager::transport(std::string_view name) const -> std::shared_ptr<Transport>
{
    auto lock = std::shared_lock(_impl->mutex);
    auto const it = _impl->servers.find(name);
    return it != _impl->servers.end() ? it->second->transport : nullptr;
}

void LifecycleManager::setMessageHandler(MessageHandler handler)
{
    auto lock = std::lock_guard(_impl->handlerMutex);
    _impl->messageHandler = std::move(handler);
}

auto LifecycleManager::subscribe() -> EventChannel<LifecycleEvent>::Receiver
{
    return _impl->events.subscribe();
}

auto LifecycleManager::options() const -> const LifecycleOptions&
{
    return _impl->options;
}

void LifecycleManager::cleanup()
{
    if (auto stopped = stopAll(true); !stopped)
        log::warning("Cleanup of MCP servers incomplete: {}", stopped.error().message);

    auto servers = std::map<std::string, std::shared_ptr<ManagedServer>, std::less<>> {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        servers.swap(_impl->servers);
    }

    // Crashed servers still own a finished supervisor thread.
    for (auto& [name, server]: servers)
    {
        auto opLock = std::lock_guard(server->operationMutex);
        _impl->stopSupervisor(*server);
    }
}

} // namespace mcprt
