// SPDX-License-Identifier: Apache-2.0
#include "McpClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <atomic>
#include <format>
#include <map>
#include <mutex>
#include <vector>

namespace mcprt
{

namespace
{

    /// @brief Initialization state of one server connection.
    struct Session
    {
        std::mutex mutex;
        std::weak_ptr<Transport> transport;
        std::optional<McpServerCapabilities> capabilities;
    };

    auto notConnected(std::string_view serverName) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::ConnectionError, std::format("Server '{}' is not connected", serverName));
    }

} // namespace

struct McpClient::Impl
{
    McpClientOptions options;

    CancellationManager cancellations;
    NotificationManager notifications;
    ServerLogger serverLogger;

    std::atomic<std::int64_t> nextRequestId { 1 };

    mutable std::mutex sessionsMutex;
    std::map<std::string, std::shared_ptr<Session>, std::less<>> sessions;

    std::mutex requestHandlerMutex;
    ServerRequestHandler requestHandler;

    // Declared last so that its supervisors stop before the managers they feed are destroyed.
    LifecycleManager lifecycle;

    Impl(McpClientOptions clientOptions, TransportFactory factory):
        options(std::move(clientOptions)),
        notifications(options.notificationHistorySize),
        serverLogger(options.serverLogLevel),
        lifecycle(options.lifecycle, std::move(factory))
    {
    }

    auto sessionFor(std::string_view serverName) -> std::shared_ptr<Session>
    {
        auto lock = std::lock_guard(sessionsMutex);
        auto it = sessions.find(serverName);
        if (it == sessions.end())
            it = sessions.emplace(std::string(serverName), std::make_shared<Session>()).first;
        return it->second;
    }

    void forgetSession(std::string_view serverName)
    {
        auto lock = std::lock_guard(sessionsMutex);
        if (auto const it = sessions.find(serverName); it != sessions.end())
            sessions.erase(it);
    }

    auto connectedTransport(std::string_view serverName) const -> Result<std::shared_ptr<Transport>>
    {
        auto transport = lifecycle.transport(serverName);
        if (!transport || !transport->isConnected())
            return notConnected(serverName);
        return transport;
    }

    /// @brief Sends one request over @p transport, tracked by the CancellationManager.
    auto call(std::string_view serverName,
              Transport& transport,
              std::string_view method,
              nlohmann::json params,
              const RequestOptions& requestOptions) -> Result<nlohmann::json>
    {
        auto const config = lifecycle.getConfig(serverName);
        auto const timeout = requestOptions.timeout.value_or(config ? config->timeout : McpServerConfig {}.timeout);
        auto const id = requestOptions.id.value_or(std::format("req-{}", nextRequestId++));

        auto registered = cancellations.registerRequest(id, std::string(serverName), std::string(method), timeout);
        if (!registered)
            return std::unexpected(registered.error());
        auto token = *registered;

        auto const request = jsonrpc::Request {
            .id = id,
            .method = std::string(method),
            .params = std::move(params),
        };

        log::trace("-> {} {} ({})", serverName, method, id);
        auto response = transport.sendRequest(request, timeout, token);
        auto const completed = cancellations.completeRequest(id, token);

        // A cancellation that lands between the response and the completion claim still wins.
        if (response && !completed)
            return std::unexpected(token.checkCancelled().error());

        if (!response)
        {
            auto const& error = response.error();
            if (error.code == ErrorCode::TimeoutError || (error.code == ErrorCode::CancelledError && token.isCancelled()))
                abandon(serverName, transport, id, token);
            return std::unexpected(error);
        }

        return response->intoResult();
    }

    /// @brief Tells the server to stop working on a request nobody waits for anymore.
    void abandon(std::string_view serverName, Transport& transport, const std::string& id, const CancellationToken& token)
    {
        if (!transport.isConnected())
            return;

        auto const reason =
            token.reason() ? std::string(describe(*token.reason())) : std::string("Request timed out");
        if (auto sent = transport.send(jsonrpc::makeCancelledNotification(id, reason)); !sent)
            log::debug("Could not notify '{}' about cancelled request {}: {}", serverName, id, sent.error().message);
    }

    auto handshake(std::string_view serverName, Transport& transport) -> Result<McpServerCapabilities>
    {
        auto params = nlohmann::json {
            { "protocolVersion", options.protocolVersion },
            { "capabilities", nlohmann::json::object() },
            { "clientInfo",
              nlohmann::json {
                  { "name", options.clientName },
                  { "version", options.clientVersion },
              } },
        };

        return call(serverName, transport, "initialize", std::move(params), RequestOptions {})
            .and_then([&](const nlohmann::json& result) -> Result<McpServerCapabilities> {
                auto const serverInfo = result.value("serverInfo", nlohmann::json::object());
                auto capabilities = McpServerCapabilities {
                    .serverName = json::getStringOr(serverInfo, "name", "unknown"),
                    .serverVersion = json::getStringOr(serverInfo, "version", "unknown"),
                    .protocolVersion = json::getStringOr(result, "protocolVersion", options.protocolVersion),
                };

                if (auto const caps = result.find("capabilities"); caps != result.end() && caps->is_object())
                {
                    capabilities.hasTools = caps->contains("tools");
                    capabilities.hasResources = caps->contains("resources");
                    capabilities.hasPrompts = caps->contains("prompts");
                    capabilities.hasLogging = caps->contains("logging");
                }

                if (auto sent = transport.send(jsonrpc::makeNotification("notifications/initialized")); !sent)
                    return std::unexpected(sent.error());

                log::info("MCP server '{}' initialized: {} v{}",
                          serverName,
                          capabilities.serverName,
                          capabilities.serverVersion);
                return capabilities;
            });
    }

    /// @brief Runs the handshake unless the current connection already completed it.
    auto ensureInitialized(std::string_view serverName, const std::shared_ptr<Transport>& transport, bool force)
        -> Result<McpServerCapabilities>
    {
        auto session = sessionFor(serverName);
        auto lock = std::lock_guard(session->mutex);
        if (!force && session->capabilities && session->transport.lock() == transport)
            return *session->capabilities;

        auto capabilities = handshake(serverName, *transport);
        if (!capabilities)
            return capabilities;

        session->transport = transport;
        session->capabilities = *capabilities;
        return capabilities;
    }

    void onMessage(std::string_view serverName, const jsonrpc::Message& message)
    {
        if (auto const* notification = std::get_if<jsonrpc::Notification>(&message))
        {
            if (notification->method == "notifications/message")
                serverLogger.handleLogNotification(serverName, notification->params);
            else
                notifications.handleNotification(serverName, notification->method, notification->params);
            return;
        }

        if (auto const* request = std::get_if<jsonrpc::Request>(&message))
        {
            answer(serverName, *request);
            return;
        }

        if (auto const* response = std::get_if<jsonrpc::Response>(&message))
            log::debug("Discarding response to unknown request {} from '{}'", response->id.dump(), serverName);
    }

    void answer(std::string_view serverName, const jsonrpc::Request& request)
    {
        auto transport = lifecycle.transport(serverName);
        if (!transport)
            return;

        auto result = Result<nlohmann::json> {};
        if (request.method == "ping")
        {
            result = nlohmann::json::object();
        }
        else
        {
            auto handler = ServerRequestHandler {};
            {
                auto lock = std::lock_guard(requestHandlerMutex);
                handler = requestHandler;
            }
            if (handler)
                result = handler(serverName, request);
            else
                result = makeServerError(static_cast<int>(RpcErrorCode::MethodNotFound),
                                         std::format("Method not found: {}", request.method));
        }

        auto const response = result ? jsonrpc::Response { .id = request.id, .result = std::move(*result) }
                                     : jsonrpc::makeErrorResponse(request.id, result.error());
        if (auto sent = transport->send(jsonrpc::toJson(response)); !sent)
            log::warning("Failed to answer {} from '{}': {}", request.method, serverName, sent.error().message);
    }
};

McpClient::McpClient(McpClientOptions options, TransportFactory factory):
    _impl(std::make_unique<Impl>(std::move(options), std::move(factory)))
{
    _impl->lifecycle.setMessageHandler(
        [impl = _impl.get()](std::string_view serverName, const jsonrpc::Message& message) {
            impl->onMessage(serverName, message);
        });
}

McpClient::~McpClient()
{
    _impl->cancellations.cancelAll(CancellationReason::Shutdown);
    _impl->lifecycle.cleanup();
}

void McpClient::addServer(std::string_view name, McpServerConfig config)
{
    _impl->serverLogger.setServerLevel(name, config.logLevel);
    _impl->lifecycle.registerServer(name, std::move(config));
}

auto McpClient::removeServer(std::string_view name) -> VoidResult
{
    _impl->cancellations.cancelServerRequests(name, CancellationReason::Shutdown);
    _impl->forgetSession(name);
    _impl->serverLogger.removeServerLevel(name);
    return _impl->lifecycle.unregisterServer(name);
}

auto McpClient::startServer(std::string_view name) -> VoidResult
{
    if (auto started = _impl->lifecycle.start(name); !started)
        return started;

    if (!_impl->options.initialize)
        return {};

    return initialize(name).transform([](const McpServerCapabilities&) {});
}

auto McpClient::stopServer(std::string_view name) -> VoidResult
{
    _impl->cancellations.cancelServerRequests(name, CancellationReason::Shutdown);
    _impl->forgetSession(name);
    return _impl->lifecycle.stop(name);
}

auto McpClient::startAll() -> VoidResult
{
    auto started = _impl->lifecycle.startAll();
    if (!_impl->options.initialize)
        return started;

    auto failures = std::vector<std::string> {};
    for (const auto& name: _impl->lifecycle.runningServers())
    {
        auto transport = _impl->connectedTransport(name);
        if (!transport)
            continue;
        if (auto capabilities = _impl->ensureInitialized(name, *transport, false); !capabilities)
        {
            log::warning("Failed to initialize MCP server '{}': {}", name, capabilities.error().message);
            failures.push_back(std::format("{}: {}", name, capabilities.error().message));
        }
    }

    if (!started)
        return started;
    if (failures.empty())
        return {};

    auto message = std::format("Failed to initialize {} server(s)", failures.size());
    for (const auto& failure: failures)
        message += std::format("; {}", failure);
    return makeError(ErrorCode::LifecycleError, std::move(message));
}

auto McpClient::stopAll() -> VoidResult
{
    _impl->cancellations.cancelAll(CancellationReason::Shutdown);
    {
        auto lock = std::lock_guard(_impl->sessionsMutex);
        _impl->sessions.clear();
    }
    return _impl->lifecycle.stopAll();
}

auto McpClient::initialize(std::string_view serverName) -> Result<McpServerCapabilities>
{
    return _impl->connectedTransport(serverName).and_then([&](const std::shared_ptr<Transport>& transport) {
        return _impl->ensureInitialized(serverName, transport, true);
    });
}

auto McpClient::capabilities(std::string_view serverName) const -> std::optional<McpServerCapabilities>
{
    auto lock = std::lock_guard(_impl->sessionsMutex);
    auto const it = _impl->sessions.find(serverName);
    if (it == _impl->sessions.end())
        return std::nullopt;

    auto sessionLock = std::lock_guard(it->second->mutex);
    return it->second->capabilities;
}

auto McpClient::request(std::string_view serverName,
                        std::string_view method,
                        nlohmann::json params,
                        RequestOptions options) -> Result<nlohmann::json>
{
    auto transport = _impl->connectedTransport(serverName);
    if (!transport)
        return std::unexpected(transport.error());

    // A server restarted by its supervisor has to be initialized again.
    if (_impl->options.initialize && method != "initialize")
    {
        if (auto initialized = _impl->ensureInitialized(serverName, *transport, false); !initialized)
            return std::unexpected(initialized.error());
    }

    return _impl->call(serverName, **transport, method, std::move(params), options);
}

auto McpClient::notify(std::string_view serverName, std::string_view method, nlohmann::json params) -> VoidResult
{
    return _impl->connectedTransport(serverName).and_then([&](const std::shared_ptr<Transport>& transport) {
        return transport->send(jsonrpc::makeNotification(method, std::move(params)));
    });
}

auto McpClient::cancel(std::string_view requestId, CancellationReason reason) -> std::optional<CancellationResult>
{
    return _impl->cancellations.cancelRequest(requestId, reason);
}

void McpClient::setRequestHandler(ServerRequestHandler handler)
{
    auto lock = std::lock_guard(_impl->requestHandlerMutex);
    _impl->requestHandler = std::move(handler);
}

auto McpClient::lifecycle() -> LifecycleManager&
{
    return _impl->lifecycle;
}

auto McpClient::cancellations() -> CancellationManager&
{
    return _impl->cancellations;
}

auto McpClient::notifications() -> NotificationManager&
{
    return _impl->notifications;
}

auto McpClient::serverLogger() -> ServerLogger&
{
    return _impl->serverLogger;
}

} // namespace mcprt
