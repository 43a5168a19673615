// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcprt::jsonrpc
{

/// @brief Represents a JSON-RPC 2.0 error object.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief A JSON-RPC 2.0 request (carries an id and expects a response).
struct Request
{
    nlohmann::json id;
    std::string method;
    nlohmann::json params;
};

/// @brief A JSON-RPC 2.0 notification (no id, no response).
struct Notification
{
    std::string method;
    nlohmann::json params;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return result.has_value(); }

    /// @brief Converts the response into its result value.
    ///
    /// A response carrying an error becomes a ServerError with the peer's code;
    /// a response carrying neither member becomes a ProtocolError.
    [[nodiscard]] auto intoResult() const -> Result<nlohmann::json>;
};

/// @brief Any message that can travel over a transport, in classification order.
using Message = std::variant<Response, Notification, Request>;

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a "notifications/cancelled" message telling a server to stop working on a request.
/// @param requestId The id of the abandoned request.
/// @param reason Optional human-readable reason.
[[nodiscard]] auto makeCancelledNotification(const nlohmann::json& requestId,
                                             std::optional<std::string> reason = std::nullopt)
    -> nlohmann::json;

/// @brief Serializes a request to its wire representation.
[[nodiscard]] auto toJson(const Request& request) -> nlohmann::json;

/// @brief Serializes a notification to its wire representation.
[[nodiscard]] auto toJson(const Notification& notification) -> nlohmann::json;

/// @brief Serializes a response to its wire representation.
[[nodiscard]] auto toJson(const Response& response) -> nlohmann::json;

/// @brief Builds the structured {code, message, data?} shape of an error.
[[nodiscard]] auto toStructuredError(const Error& error) -> nlohmann::json;

/// @brief Builds a response that reports @p error for the request @p id.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, const Error& error) -> Response;

/// @brief Returns the key under which a request id is tracked.
///
/// The key is the id's JSON text, so a string id never shares a key with a number.
/// @return The key, or std::nullopt if the id is neither a string nor a number.
[[nodiscard]] auto idKey(const nlohmann::json& id) -> std::optional<std::string>;

/// @brief Parses a JSON-RPC 2.0 response.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Classifies a decoded JSON value as a response, a notification, or a request, in that order.
/// @param message The JSON value.
/// @return The classified message, or a ProtocolError if it is none of them.
[[nodiscard]] auto classify(const nlohmann::json& message) -> Result<Message>;

/// @brief Decodes and classifies a single line of wire text.
[[nodiscard]] auto parseMessage(std::string_view line) -> Result<Message>;

} // namespace mcprt::jsonrpc
