// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcprt
{

/// @brief Error kinds surfaced by the runtime.
///
/// Each kind maps to one numeric wire code (see wireCode()), except ServerError,
/// which carries the code reported by the remote peer.
enum class ErrorCode
{
    ConnectionError,
    TransportError,
    ProtocolError,
    TimeoutError,
    CancelledError,
    ServerError,
    ValidationError,
    ConfigError,
    LifecycleError,
    ToolError,
    ResourceError,
    PermissionDenied,
    IoError,
    SerializationError,
};

/// @brief Numeric JSON-RPC error codes, including the MCP extension range.
enum class RpcErrorCode : int
{
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,

    ConnectionError = -32000,
    TransportError = -32001,
    ProtocolError = -32002,
    TimeoutError = -32003,
    CancelledError = -32004,
    ValidationError = -32005,
    ConfigError = -32006,
    LifecycleError = -32007,
    ToolError = -32008,
    ResourceError = -32009,
    PermissionDenied = -32010,
};

/// @brief Represents an error with a kind, a descriptive message and optional details.
struct Error
{
    ErrorCode code = ErrorCode::ProtocolError;
    std::string message;

    /// @brief Code reported by the peer; only meaningful for ServerError.
    int serverCode = 0;

    /// @brief Optional structured details (the JSON-RPC "data" member).
    nlohmann::json data;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error kind.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { .code = code, .message = std::move(message) });
}

/// @brief Creates an unexpected Error that wraps an error returned by the remote peer.
/// @param serverCode The peer's numeric error code.
/// @param message The peer's error message.
/// @param data The peer's optional error data.
[[nodiscard]] inline auto makeServerError(int serverCode, std::string message, nlohmann::json data = nullptr)
    -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error {
        .code = ErrorCode::ServerError,
        .message = std::move(message),
        .serverCode = serverCode,
        .data = std::move(data),
    });
}

/// @brief Returns the wire code for an error kind.
///
/// ServerError has no fixed code and maps to InternalError here; use wireCode(const Error&)
/// to obtain the peer's own code.
[[nodiscard]] constexpr auto wireCode(ErrorCode code) -> int
{
    switch (code)
    {
        case ErrorCode::ConnectionError: return static_cast<int>(RpcErrorCode::ConnectionError);
        case ErrorCode::TransportError: return static_cast<int>(RpcErrorCode::TransportError);
        case ErrorCode::ProtocolError: return static_cast<int>(RpcErrorCode::ProtocolError);
        case ErrorCode::TimeoutError: return static_cast<int>(RpcErrorCode::TimeoutError);
        case ErrorCode::CancelledError: return static_cast<int>(RpcErrorCode::CancelledError);
        case ErrorCode::ValidationError: return static_cast<int>(RpcErrorCode::ValidationError);
        case ErrorCode::ConfigError: return static_cast<int>(RpcErrorCode::ConfigError);
        case ErrorCode::LifecycleError: return static_cast<int>(RpcErrorCode::LifecycleError);
        case ErrorCode::ToolError: return static_cast<int>(RpcErrorCode::ToolError);
        case ErrorCode::ResourceError: return static_cast<int>(RpcErrorCode::ResourceError);
        case ErrorCode::PermissionDenied: return static_cast<int>(RpcErrorCode::PermissionDenied);
        case ErrorCode::SerializationError: return static_cast<int>(RpcErrorCode::ParseError);
        case ErrorCode::ServerError:
        case ErrorCode::IoError: return static_cast<int>(RpcErrorCode::InternalError);
    }
    return static_cast<int>(RpcErrorCode::InternalError);
}

/// @brief Returns the wire code of an error, using the peer's code for ServerError.
[[nodiscard]] inline auto wireCode(const Error& error) -> int
{
    if (error.code == ErrorCode::ServerError)
        return error.serverCode;
    return wireCode(error.code);
}

/// @brief Returns a short human-readable description of a wire code.
[[nodiscard]] constexpr auto describe(RpcErrorCode code) -> std::string_view
{
    switch (code)
    {
        case RpcErrorCode::ParseError: return "Parse error";
        case RpcErrorCode::InvalidRequest: return "Invalid request";
        case RpcErrorCode::MethodNotFound: return "Method not found";
        case RpcErrorCode::InvalidParams: return "Invalid params";
        case RpcErrorCode::InternalError: return "Internal error";
        case RpcErrorCode::ConnectionError: return "Connection error";
        case RpcErrorCode::TransportError: return "Transport error";
        case RpcErrorCode::ProtocolError: return "Protocol error";
        case RpcErrorCode::TimeoutError: return "Timeout error";
        case RpcErrorCode::CancelledError: return "Cancelled";
        case RpcErrorCode::ValidationError: return "Validation error";
        case RpcErrorCode::ConfigError: return "Configuration error";
        case RpcErrorCode::LifecycleError: return "Lifecycle error";
        case RpcErrorCode::ToolError: return "Tool error";
        case RpcErrorCode::ResourceError: return "Resource error";
        case RpcErrorCode::PermissionDenied: return "Permission denied";
    }
    return "Unknown error";
}

/// @brief Returns the display name of an error kind.
[[nodiscard]] constexpr auto errorKindName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::ConnectionError: return "Connection error";
        case ErrorCode::TransportError: return "Transport error";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::TimeoutError: return "Timeout";
        case ErrorCode::CancelledError: return "Cancelled";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::LifecycleError: return "Lifecycle error";
        case ErrorCode::ToolError: return "Tool error";
        case ErrorCode::ResourceError: return "Resource error";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::IoError: return "IO error";
        case ErrorCode::SerializationError: return "Serialization error";
    }
    return "Error";
}

} // namespace mcprt

template <>
struct std::formatter<mcprt::Error>: std::formatter<std::string>
{
    auto format(const mcprt::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}: {}", mcprt::wireCode(error), mcprt::errorKindName(error.code), error.message),
            ctx);
    }
};
