// SPDX-License-Identifier: Apache-2.0
#include <mcp/StdioTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cerrno>
#include <future>
#include <thread>

#include <signal.h>

using namespace mcprt;
using namespace std::chrono_literals;

namespace
{

/// @brief Spawns `cat`, which echoes every line back and so answers any response-shaped message.
auto makeEchoTransport() -> StdioTransport
{
    return StdioTransport(StdioTransportConfig { .command = "cat", .shutdownTimeout = 1s });
}

/// @brief Waits until @p transport has @p count requests in flight.
auto waitForPending(const StdioTransport& transport, std::size_t count) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + 5s;
    while (transport.pendingRequestCount() != count)
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

auto waitForEvent(EventChannel<TransportEvent>::Receiver& events, TransportEvent::Kind kind)
    -> std::optional<TransportEvent>
{
    auto const deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline)
    {
        auto event = events.receive(100ms);
        if (event && event->kind == kind)
            return event;
    }
    return std::nullopt;
}

} // namespace

TEST_CASE("StdioTransport starts disconnected", "[transport]")
{
    auto transport = makeEchoTransport();
    CHECK(!transport.isConnected());
    CHECK(transport.state() == TransportState::Disconnected);
    CHECK(!transport.processId().has_value());
    CHECK(transport.type() == TransportType::Stdio);
}

TEST_CASE("StdioTransport send fails when not connected", "[transport]")
{
    auto transport = makeEchoTransport();
    auto result = transport.send(nlohmann::json { { "test", true } });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport sendRequest fails when not connected", "[transport]")
{
    auto transport = makeEchoTransport();
    auto result = transport.sendRequest(jsonrpc::Request { .id = "r1", .method = "ping" }, 100ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TransportError);
}

TEST_CASE("StdioTransport requires a command", "[transport]")
{
    auto transport = StdioTransport(StdioTransportConfig {});
    auto result = transport.connect();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("StdioTransport fails to start invalid command", "[transport]")
{
    auto transport = StdioTransport(StdioTransportConfig { .command = "/nonexistent/command/that/does/not/exist" });
    auto result = transport.connect();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConnectionError);
    CHECK(transport.state() == TransportState::Error);
}

TEST_CASE("StdioTransport connects and reports its process", "[transport]")
{
    auto transport = makeEchoTransport();
    auto events = transport.subscribe();

    REQUIRE(transport.connect().has_value());
    CHECK(transport.isConnected());
    CHECK(transport.processId().has_value());
    CHECK(waitForEvent(events, TransportEvent::Kind::Connected).has_value());

    auto again = transport.connect();
    REQUIRE(!again.has_value());
    CHECK(again.error().code == ErrorCode::TransportError);

    transport.disconnect();
    CHECK(!transport.isConnected());
    CHECK(!transport.processId().has_value());
    CHECK(waitForEvent(events, TransportEvent::Kind::Disconnected).has_value());
}

TEST_CASE("StdioTransport publishes inbound notifications", "[transport]")
{
    auto transport = makeEchoTransport();
    auto events = transport.subscribe();
    REQUIRE(transport.connect().has_value());

    REQUIRE(transport.send(jsonrpc::makeNotification("notifications/tools/list_changed")).has_value());

    auto event = waitForEvent(events, TransportEvent::Kind::MessageReceived);
    REQUIRE(event.has_value());
    REQUIRE(event->message.has_value());
    REQUIRE(std::holds_alternative<jsonrpc::Notification>(*event->message));
    CHECK(std::get<jsonrpc::Notification>(*event->message).method == "notifications/tools/list_changed");
}

TEST_CASE("StdioTransport correlates responses by id", "[transport]")
{
    auto transport = makeEchoTransport();
    REQUIRE(transport.connect().has_value());

    auto pending = std::async(std::launch::async, [&] {
        return transport.sendRequest(jsonrpc::Request { .id = "r1", .method = "tools/list" }, 5s);
    });
    REQUIRE(waitForPending(transport, 1));

    // cat echoes this back, which resolves r1.
    auto const reply = jsonrpc::Response { .id = "r1", .result = nlohmann::json { { "tools", nlohmann::json::array() } } };
    REQUIRE(transport.send(jsonrpc::toJson(reply)).has_value());

    auto response = pending.get();
    REQUIRE(response.has_value());
    CHECK(response->id == "r1");
    REQUIRE(response->isSuccess());
    CHECK(response->result->at("tools").empty());
    CHECK(transport.pendingRequestCount() == 0);
}

TEST_CASE("StdioTransport matches responses that arrive out of order", "[transport]")
{
    // Answers the string id "1" before the numeric id 1, then echoes.
    auto transport = StdioTransport(StdioTransportConfig {
        .command = "sh",
        .args = { "-c",
                  R"(read first; read second; )"
                  R"(printf '{"jsonrpc":"2.0","id":"1","result":{"kind":"string"}}\n'; )"
                  R"(printf '{"jsonrpc":"2.0","id":1,"result":{"kind":"number"}}\n'; cat)" },
        .shutdownTimeout = 1s,
    });
    REQUIRE(transport.connect().has_value());

    auto numeric = std::async(std::launch::async, [&] {
        return transport.sendRequest(jsonrpc::Request { .id = 1, .method = "tools/list" }, 5s);
    });
    REQUIRE(waitForPending(transport, 1));
    auto text = std::async(std::launch::async, [&] {
        return transport.sendRequest(jsonrpc::Request { .id = "1", .method = "tools/list" }, 5s);
    });

    auto const numericResponse = numeric.get();
    auto const textResponse = text.get();
    REQUIRE(numericResponse.has_value());
    REQUIRE(textResponse.has_value());
    CHECK(numericResponse->id == 1);
    CHECK(numericResponse->result->at("kind") == "number");
    CHECK(textResponse->id == "1");
    CHECK(textResponse->result->at("kind") == "string");
    CHECK(transport.pendingRequestCount() == 0);
}

TEST_CASE("StdioTransport skips lines that are not JSON-RPC", "[transport]")
{
    auto transport = StdioTransport(StdioTransportConfig {
        .command = "sh",
        .args = { "-c", R"(echo 'server starting...'; echo '{"truncated":'; echo '[1,2,3]'; cat)" },
        .shutdownTimeout = 1s,
    });
    auto events = transport.subscribe();
    REQUIRE(transport.connect().has_value());

    auto pending = std::async(std::launch::async, [&] {
        return transport.sendRequest(jsonrpc::Request { .id = "r1", .method = "ping" }, 5s);
    });
    REQUIRE(waitForPending(transport, 1));
    REQUIRE(transport.send(jsonrpc::toJson(jsonrpc::Response { .id = "r1", .result = nlohmann::json::object() }))
                .has_value());

    auto const response = pending.get();
    REQUIRE(response.has_value());
    CHECK(response->isSuccess());
    CHECK(transport.isConnected());

    for (auto const& event: events.drain())
    {
        CHECK(event.kind != TransportEvent::Kind::Error);
        CHECK(event.kind != TransportEvent::Kind::MessageReceived);
    }
}

TEST_CASE("StdioTransport moves to the error state when the child stops reading", "[transport]")
{
    // The shell closes its stdin, so writes fail with a broken pipe while stdout stays open.
    auto transport = StdioTransport(StdioTransportConfig {
        .command = "sh",
        .args = { "-c", "exec 0<&-; exec sleep 30" },
        .shutdownTimeout = 100ms,
    });
    auto events = transport.subscribe();
    REQUIRE(transport.connect().has_value());

    auto const deadline = std::chrono::steady_clock::now() + 5s;
    while (transport.state() == TransportState::Connected && std::chrono::steady_clock::now() < deadline)
    {
        if (!transport.send(jsonrpc::makeNotification("notifications/initialized")).has_value())
            break;
        std::this_thread::sleep_for(20ms);
    }

    auto const error = waitForEvent(events, TransportEvent::Kind::Error);
    REQUIRE(error.has_value());
    CHECK(error->reason.starts_with("Failed to write to process stdin"));
    CHECK(transport.state() == TransportState::Error);
    CHECK(!transport.isConnected());

    auto const rejected = transport.sendRequest(jsonrpc::Request { .id = "late", .method = "ping" }, 100ms);
    REQUIRE(!rejected.has_value());
    CHECK(rejected.error().code == ErrorCode::TransportError);

    transport.terminate();
}

TEST_CASE("StdioTransport times out requests without a response", "[transport]")
{
    auto transport = makeEchoTransport();
    REQUIRE(transport.connect().has_value());

    auto result = transport.sendRequest(jsonrpc::Request { .id = "slow", .method = "tools/call" }, 100ms);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::TimeoutError);
    CHECK(transport.pendingRequestCount() == 0);
}

TEST_CASE("StdioTransport rejects a request id already in flight", "[transport]")
{
    auto transport = makeEchoTransport();
    REQUIRE(transport.connect().has_value());

    auto pending = std::async(std::launch::async, [&] {
        return transport.sendRequest(jsonrpc::Request { .id = 1, .method = "tools/list" }, 5s);
    });
    REQUIRE(waitForPending(transport, 1));

    auto duplicate = transport.sendRequest(jsonrpc::Request { .id = 1, .method = "tools/list" }, 100ms);
    REQUIRE(!duplicate.has_value());
    CHECK(duplicate.error().code == ErrorCode::ValidationError);

    transport.disconnect();
    CHECK(!pending.get().has_value());
}

TEST_CASE("StdioTransport resolves pending requests as cancelled on disconnect", "[transport]")
{
    auto transport = makeEchoTransport();
    REQUIRE(transport.connect().has_value());

    auto pending = std::async(std::launch::async, [&] {
        return transport.sendRequest(jsonrpc::Request { .id = "r1", .method = "tools/call" }, 30s);
    });
    REQUIRE(waitForPending(transport, 1));

    transport.disconnect();

    auto result = pending.get();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::CancelledError);
    CHECK(transport.pendingRequestCount() == 0);
}

TEST_CASE("StdioTransport resolves a request when its token is cancelled", "[transport][cancellation]")
{
    auto transport = makeEchoTransport();
    REQUIRE(transport.connect().has_value());

    auto token = CancellationToken {};
    auto pending = std::async(std::launch::async, [&] {
        return transport.sendRequest(jsonrpc::Request { .id = "r1", .method = "tools/call" }, 30s, token);
    });
    REQUIRE(waitForPending(transport, 1));

    CHECK(token.cancel(CancellationReason::UserCancelled));

    auto result = pending.get();
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::CancelledError);
    CHECK(result.error().data["reason"] == "Request cancelled by user");
    CHECK(transport.pendingRequestCount() == 0);
}

TEST_CASE("StdioTransport reports a process that exits on its own", "[transport]")
{
    auto transport = StdioTransport(StdioTransportConfig { .command = "sh", .args = { "-c", "exit 0" } });
    auto events = transport.subscribe();
    REQUIRE(transport.connect().has_value());

    auto event = waitForEvent(events, TransportEvent::Kind::Disconnected);
    REQUIRE(event.has_value());
    CHECK(event->reason == "Process exited");
    CHECK(!transport.isConnected());
}

TEST_CASE("StdioTransport disconnect lets the child exit on end of input", "[transport]")
{
    auto transport = StdioTransport(StdioTransportConfig { .command = "cat", .shutdownTimeout = 10s });
    REQUIRE(transport.connect().has_value());
    auto const pid = transport.processId();
    REQUIRE(pid.has_value());

    auto const started = std::chrono::steady_clock::now();
    transport.disconnect();
    CHECK(std::chrono::steady_clock::now() - started < 5s);
    CHECK(::kill(*pid, 0) == -1);
    CHECK(errno == ESRCH);
}

TEST_CASE("StdioTransport disconnect kills a child that ignores SIGTERM", "[transport]")
{
    // Ignored signals stay ignored across exec, so sleep neither reads stdin nor honours SIGTERM.
    auto transport = StdioTransport(StdioTransportConfig {
        .command = "sh",
        .args = { "-c", R"(trap '' TERM; exec sleep 30)" },
        .shutdownTimeout = 200ms,
    });
    REQUIRE(transport.connect().has_value());
    auto const pid = transport.processId();
    REQUIRE(pid.has_value());
    std::this_thread::sleep_for(100ms);

    auto const started = std::chrono::steady_clock::now();
    transport.disconnect();
    auto const elapsed = std::chrono::steady_clock::now() - started;

    CHECK(elapsed >= 200ms);
    CHECK(elapsed < 5s);
    CHECK(!transport.isConnected());
    CHECK(::kill(*pid, 0) == -1);
    CHECK(errno == ESRCH);
}

TEST_CASE("StdioTransport passes environment overrides to the child", "[transport]")
{
    auto transport = StdioTransport(StdioTransportConfig {
        .command = "sh",
        .args = { "-c", R"(printf '{"jsonrpc":"2.0","method":"env","params":{"value":"%s"}}\n' "$MCPRT_TEST_VALUE"; cat)" },
        .env = { { "MCPRT_TEST_VALUE", "hello" } },
    });
    auto events = transport.subscribe();
    REQUIRE(transport.connect().has_value());

    auto event = waitForEvent(events, TransportEvent::Kind::MessageReceived);
    REQUIRE(event.has_value());
    REQUIRE(std::holds_alternative<jsonrpc::Notification>(*event->message));
    CHECK(std::get<jsonrpc::Notification>(*event->message).params["value"] == "hello");
}

TEST_CASE("StdioTransport generates distinct request ids", "[transport]")
{
    auto transport = makeEchoTransport();
    auto const first = transport.nextRequestId();
    auto const second = transport.nextRequestId();
    CHECK(first.starts_with("req-"));
    CHECK(first != second);
}
