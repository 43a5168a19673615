// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcprt;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "test/method");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "test/method");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "key", "value" } };
    auto request = jsonrpc::makeRequest(42, "test/method", params);

    REQUIRE(request.contains("params"));
    CHECK(request["params"]["key"] == "value");
}

TEST_CASE("makeNotification creates valid notification (no id)", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("test/notify");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "test/notify");
}

TEST_CASE("makeCancelledNotification references the abandoned request", "[jsonrpc]")
{
    auto notif = jsonrpc::makeCancelledNotification("req-7", "Request timed out");

    CHECK(notif["method"] == "notifications/cancelled");
    CHECK(notif["params"]["requestId"] == "req-7");
    CHECK(notif["params"]["reason"] == "Request timed out");

    auto withoutReason = jsonrpc::makeCancelledNotification(3);
    CHECK(withoutReason["params"]["requestId"] == 3);
    CHECK(!withoutReason["params"].contains("reason"));
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseResponse handles error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "error",
          {
              { "code", -32600 },
              { "message", "Invalid Request" },
          } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32600);
    CHECK(result->error->message == "Invalid Request");
}

TEST_CASE("parseResponse rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "version", "1.0" } };
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse handles response without result or error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("intoResult turns a peer error into a ServerError", "[jsonrpc]")
{
    auto response = jsonrpc::Response {
        .id = 5,
        .result = std::nullopt,
        .error = jsonrpc::RpcError { .code = -32601, .message = "Method not found", .data = { { "method", "x" } } },
    };

    auto result = response.intoResult();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ServerError);
    CHECK(result.error().serverCode == -32601);
    CHECK(wireCode(result.error()) == -32601);
    CHECK(result.error().data["method"] == "x");
}

TEST_CASE("classify distinguishes responses, notifications and requests", "[jsonrpc]")
{
    SECTION("response")
    {
        auto message = jsonrpc::classify({ { "jsonrpc", "2.0" }, { "id", "a" }, { "result", 1 } });
        REQUIRE(message.has_value());
        REQUIRE(std::holds_alternative<jsonrpc::Response>(*message));
        CHECK(std::get<jsonrpc::Response>(*message).id == "a");
    }

    SECTION("notification")
    {
        auto message = jsonrpc::classify(
            { { "jsonrpc", "2.0" }, { "method", "notifications/progress" }, { "params", { { "progress", 1 } } } });
        REQUIRE(message.has_value());
        REQUIRE(std::holds_alternative<jsonrpc::Notification>(*message));
        CHECK(std::get<jsonrpc::Notification>(*message).method == "notifications/progress");
        CHECK(std::get<jsonrpc::Notification>(*message).params["progress"] == 1);
    }

    SECTION("request")
    {
        auto message = jsonrpc::classify({ { "jsonrpc", "2.0" }, { "id", 9 }, { "method", "ping" } });
        REQUIRE(message.has_value());
        REQUIRE(std::holds_alternative<jsonrpc::Request>(*message));
        CHECK(std::get<jsonrpc::Request>(*message).id == 9);
        CHECK(std::get<jsonrpc::Request>(*message).params.is_null());
    }

    SECTION("neither")
    {
        auto message = jsonrpc::classify({ { "jsonrpc", "2.0" }, { "params", 1 } });
        REQUIRE(!message.has_value());
        CHECK(message.error().code == ErrorCode::ProtocolError);
    }
}

TEST_CASE("parseMessage reports malformed lines", "[jsonrpc]")
{
    auto result = jsonrpc::parseMessage("{not json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::SerializationError);
}

TEST_CASE("idKey normalizes string and numeric ids", "[jsonrpc]")
{
    CHECK(jsonrpc::idKey("req-1") == R"("req-1")");
    CHECK(jsonrpc::idKey(17) == "17");
    CHECK(jsonrpc::idKey(nlohmann::json::parse("17")) == jsonrpc::idKey(17));
    CHECK(!jsonrpc::idKey(nullptr).has_value());
    CHECK(!jsonrpc::idKey(nlohmann::json::array()).has_value());
}

TEST_CASE("idKey keeps a numeric-looking string apart from the number", "[jsonrpc]")
{
    CHECK(jsonrpc::idKey("1") != jsonrpc::idKey(1));
    CHECK(jsonrpc::idKey("1") == jsonrpc::idKey(nlohmann::json::parse(R"("1")")));
}

TEST_CASE("makeErrorResponse carries the wire code of the error", "[jsonrpc]")
{
    auto const error = Error { .code = ErrorCode::TimeoutError, .message = "too slow" };
    auto const response = jsonrpc::makeErrorResponse("req-2", error);
    auto const wire = jsonrpc::toJson(response);

    CHECK(wire["id"] == "req-2");
    CHECK(wire["error"]["code"] == -32003);
    CHECK(wire["error"]["message"] == "too slow");
    CHECK(!wire.contains("result"));
}
