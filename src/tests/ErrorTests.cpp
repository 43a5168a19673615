// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>

using namespace mcprt;

TEST_CASE("Error kinds map to their wire codes", "[error]")
{
    CHECK(wireCode(ErrorCode::ConnectionError) == -32000);
    CHECK(wireCode(ErrorCode::TransportError) == -32001);
    CHECK(wireCode(ErrorCode::ProtocolError) == -32002);
    CHECK(wireCode(ErrorCode::TimeoutError) == -32003);
    CHECK(wireCode(ErrorCode::CancelledError) == -32004);
    CHECK(wireCode(ErrorCode::ValidationError) == -32005);
    CHECK(wireCode(ErrorCode::ConfigError) == -32006);
    CHECK(wireCode(ErrorCode::LifecycleError) == -32007);
    CHECK(wireCode(ErrorCode::ToolError) == -32008);
    CHECK(wireCode(ErrorCode::ResourceError) == -32009);
    CHECK(wireCode(ErrorCode::PermissionDenied) == -32010);
    CHECK(wireCode(ErrorCode::SerializationError) == -32700);
    CHECK(wireCode(ErrorCode::IoError) == -32603);
}

TEST_CASE("ServerError keeps the peer's code", "[error]")
{
    auto const error = makeServerError(-32601, "Method not found").error();
    CHECK(error.code == ErrorCode::ServerError);
    CHECK(wireCode(error) == -32601);
}

TEST_CASE("Structured error includes data only when present", "[error]")
{
    auto const plain = jsonrpc::toStructuredError(Error { .code = ErrorCode::ConfigError, .message = "bad" });
    CHECK(plain["code"] == -32006);
    CHECK(plain["message"] == "bad");
    CHECK(!plain.contains("data"));

    auto const detailed = jsonrpc::toStructuredError(
        Error { .code = ErrorCode::LifecycleError, .message = "down", .data = { { "server", "fs" } } });
    CHECK(detailed["data"]["server"] == "fs");
}

TEST_CASE("describe covers the standard JSON-RPC codes", "[error]")
{
    CHECK(describe(RpcErrorCode::ParseError) == "Parse error");
    CHECK(describe(RpcErrorCode::MethodNotFound) == "Method not found");
    CHECK(describe(RpcErrorCode::CancelledError) == "Cancelled");
}

TEST_CASE("Error formats with code and kind", "[error]")
{
    auto const error = Error { .code = ErrorCode::TimeoutError, .message = "no answer" };
    CHECK(std::format("{}", error) == "[-32003] Timeout: no answer");
}
