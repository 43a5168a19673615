// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace mcprt::jsonrpc
{

namespace
{

    auto hasVersion(const nlohmann::json& message) -> bool
    {
        auto const it = message.find("jsonrpc");
        return it != message.end() && it->is_string() && it->get<std::string>() == "2.0";
    }

    auto parseRpcError(const nlohmann::json& err) -> RpcError
    {
        if (!err.is_object())
            return RpcError { .code = static_cast<int>(RpcErrorCode::InternalError), .message = "Unknown error" };

        return RpcError {
            .code = err.value("code", static_cast<int>(RpcErrorCode::InternalError)),
            .message = err.value("message", "Unknown error"),
            .data = err.value("data", nlohmann::json {}),
        };
    }

} // namespace

auto Response::intoResult() const -> Result<nlohmann::json>
{
    if (error)
        return makeServerError(error->code, error->message, error->data);
    if (result)
        return *result;
    return makeError(ErrorCode::ProtocolError, "Response has neither result nor error");
}

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    return toJson(Request { .id = id, .method = std::string(method), .params = std::move(params) });
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    return toJson(Notification { .method = std::string(method), .params = std::move(params) });
}

auto makeCancelledNotification(const nlohmann::json& requestId, std::optional<std::string> reason)
    -> nlohmann::json
{
    auto params = nlohmann::json { { "requestId", requestId } };
    if (reason)
        params["reason"] = std::move(*reason);
    return makeNotification("notifications/cancelled", std::move(params));
}

auto toJson(const Request& request) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", request.id },
        { "method", request.method },
    };

    if (!request.params.is_null())
        msg["params"] = request.params;

    return msg;
}

auto toJson(const Notification& notification) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", notification.method },
    };

    if (!notification.params.is_null())
        msg["params"] = notification.params;

    return msg;
}

auto toJson(const Response& response) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", response.id },
    };

    if (response.error)
    {
        auto err = nlohmann::json {
            { "code", response.error->code },
            { "message", response.error->message },
        };
        if (!response.error->data.is_null())
            err["data"] = response.error->data;
        msg["error"] = std::move(err);
    }
    else
    {
        msg["result"] = response.result.value_or(nlohmann::json::object());
    }

    return msg;
}

auto toStructuredError(const Error& error) -> nlohmann::json
{
    auto shape = nlohmann::json {
        { "code", wireCode(error) },
        { "message", error.message },
    };
    if (!error.data.is_null())
        shape["data"] = error.data;
    return shape;
}

auto makeErrorResponse(const nlohmann::json& id, const Error& error) -> Response
{
    return Response {
        .id = id,
        .result = std::nullopt,
        .error = RpcError { .code = wireCode(error), .message = error.message, .data = error.data },
    };
}

auto idKey(const nlohmann::json& id) -> std::optional<std::string>
{
    // The serialized form keeps "1" and 1 apart.
    if (id.is_string() || id.is_number())
        return id.dump();
    return std::nullopt;
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object() || !hasVersion(message))
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    if (message.contains("method"))
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message is a request or notification");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("error"))
        response.error = parseRpcError(message["error"]);
    else if (message.contains("result"))
        response.result = message["result"];
    else
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");

    return response;
}

auto classify(const nlohmann::json& message) -> Result<Message>
{
    if (!message.is_object() || !hasVersion(message))
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    auto const hasId = message.contains("id") && idKey(message["id"]).has_value();
    auto const methodIt = message.find("method");
    auto const hasMethod = methodIt != message.end() && methodIt->is_string();

    if (hasId && !hasMethod)
    {
        auto response = parseResponse(message);
        if (!response)
            return std::unexpected(response.error());
        return Message { std::move(*response) };
    }

    if (!hasMethod)
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither result, error, nor method");

    auto params = message.value("params", nlohmann::json {});

    if (!message.contains("id"))
        return Message { Notification { .method = methodIt->get<std::string>(), .params = std::move(params) } };

    if (!hasId)
        return makeError(ErrorCode::ProtocolError, "JSON-RPC request id must be a string or a number");

    return Message { Request {
        .id = message["id"],
        .method = methodIt->get<std::string>(),
        .params = std::move(params),
    } };
}

auto parseMessage(std::string_view line) -> Result<Message>
{
    return json::parse(line).and_then([](const nlohmann::json& value) { return classify(value); });
}

} // namespace mcprt::jsonrpc
