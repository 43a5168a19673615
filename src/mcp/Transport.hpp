// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/EventChannel.hpp>
#include <core/Types.hpp>
#include <mcp/CancellationToken.hpp>
#include <mcp/JsonRpc.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcprt
{

/// @brief Connection state of a transport.
enum class TransportState : std::uint8_t
{
    Disconnected,
    Connecting,
    Connected,
    Closing,
    Error,
};

/// @brief Converts a TransportState to a lowercase display name.
[[nodiscard]] constexpr auto transportStateName(TransportState state) -> std::string_view
{
    switch (state)
    {
        case TransportState::Disconnected: return "disconnected";
        case TransportState::Connecting: return "connecting";
        case TransportState::Connected: return "connected";
        case TransportState::Closing: return "closing";
        case TransportState::Error: return "error";
    }
    return "unknown";
}

/// @brief Event published by a transport to its subscribers.
struct TransportEvent
{
    enum class Kind : std::uint8_t
    {
        Connecting,
        Connected,
        Disconnected,
        Error,
        MessageReceived,
    };

    Kind kind = Kind::Connecting;

    /// @brief Disconnect reason or error description.
    std::string reason;

    /// @brief Inbound notification or server-initiated request, for MessageReceived.
    std::optional<jsonrpc::Message> message;
};

/// @brief Abstract interface for MCP transport communication.
///
/// Implementations frame JSON-RPC messages for one wire format. Responses are correlated
/// to requests by id; every other inbound message is published as a TransportEvent.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Returns the wire format of this transport.
    [[nodiscard]] virtual auto type() const -> TransportType = 0;

    /// @brief Establishes the connection.
    /// @return Success or a ConnectionError / TransportError.
    [[nodiscard]] virtual auto connect() -> VoidResult = 0;

    /// @brief Closes the connection. Every pending request is resolved with a CancelledError.
    virtual void disconnect() = 0;

    /// @brief Closes the connection without granting the peer a grace period.
    virtual void terminate() { disconnect(); }

    /// @brief Sends a message without waiting for any response.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Sends a request and waits for its response.
    ///
    /// Returns once the matching response arrives, the timeout elapses (TimeoutError),
    /// @p token is cancelled (CancelledError) or the transport disconnects (CancelledError).
    /// A response that carries a JSON-RPC error is still returned as a Response.
    /// @param request The request; its id must not be in flight already.
    /// @param timeout Maximum time to wait for the response.
    /// @param token Token that aborts the wait when cancelled.
    [[nodiscard]] virtual auto sendRequest(const jsonrpc::Request& request,
                                           std::chrono::milliseconds timeout,
                                           CancellationToken token) -> Result<jsonrpc::Response> = 0;

    /// @brief Sends a request that can only be aborted by timeout or disconnect.
    [[nodiscard]] auto sendRequest(const jsonrpc::Request& request, std::chrono::milliseconds timeout)
        -> Result<jsonrpc::Response>
    {
        return sendRequest(request, timeout, CancellationToken {});
    }

    /// @brief Subscribes to connection and inbound message events.
    [[nodiscard]] virtual auto subscribe() -> EventChannel<TransportEvent>::Receiver = 0;

    /// @brief Returns the current connection state.
    [[nodiscard]] virtual auto state() const -> TransportState = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool { return state() == TransportState::Connected; }

    /// @brief Returns the OS process id behind the transport, if there is one.
    [[nodiscard]] virtual auto processId() const -> std::optional<int> { return std::nullopt; }
};

} // namespace mcprt
