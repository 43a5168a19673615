// SPDX-License-Identifier: Apache-2.0
#include <mcp/CancellationManager.hpp>

#include <catch2/catch_test_macros.hpp>

#include <thread>

using namespace mcprt;
using namespace std::chrono_literals;

TEST_CASE("CancellationToken cancels only once", "[cancellation]")
{
    auto token = CancellationToken {};
    auto copy = token;
    auto calls = 0;
    token.onCancel([&](CancellationReason reason) {
        ++calls;
        CHECK(reason == CancellationReason::Timeout);
    });

    CHECK(!copy.isCancelled());
    CHECK(copy.checkCancelled().has_value());

    CHECK(copy.cancel(CancellationReason::Timeout));
    CHECK(!token.cancel(CancellationReason::UserCancelled));

    CHECK(token.isCancelled());
    CHECK(token.reason() == CancellationReason::Timeout);
    CHECK(token.cancelledAt().has_value());
    CHECK(calls == 1);
    CHECK(token == copy);

    auto check = token.checkCancelled();
    REQUIRE(!check.has_value());
    CHECK(check.error().code == ErrorCode::CancelledError);
}

TEST_CASE("CancellationToken runs late callbacks immediately", "[cancellation]")
{
    auto token = CancellationToken {};
    token.cancel(CancellationReason::Shutdown);

    auto received = std::optional<CancellationReason> {};
    token.onCancel([&](CancellationReason reason) { received = reason; });
    CHECK(received == CancellationReason::Shutdown);
}

TEST_CASE("CancellationToken removed callbacks do not run", "[cancellation]")
{
    auto token = CancellationToken {};
    auto called = false;
    auto const id = token.onCancel([&](CancellationReason) { called = true; });
    token.removeCallback(id);
    token.cancel(CancellationReason::UserCancelled);
    CHECK(!called);
}

TEST_CASE("CancellationManager cancels a request once", "[cancellation]")
{
    auto manager = CancellationManager {};
    auto token = manager.registerRequest("r1", "fs", "tools/call").value();

    REQUIRE(manager.hasRequest("r1"));

    auto result = manager.cancelRequest("r1", CancellationReason::UserCancelled);
    REQUIRE(result.has_value());
    CHECK(result->success);
    CHECK(result->requestId == "r1");
    CHECK(result->serverName == "fs");
    CHECK(token.isCancelled());
    CHECK(token.reason() == CancellationReason::UserCancelled);
    CHECK(!manager.hasRequest("r1"));

    // A second cancellation finds nothing to do.
    CHECK(!manager.cancelRequest("r1", CancellationReason::Timeout).has_value());
    CHECK(token.reason() == CancellationReason::UserCancelled);
}

TEST_CASE("CancellationManager completion wins over later cancellation", "[cancellation]")
{
    auto manager = CancellationManager {};
    auto token = manager.registerRequest("r1", "fs", "tools/call").value();

    CHECK(manager.unregisterRequest("r1"));
    CHECK(!manager.unregisterRequest("r1"));
    CHECK(!manager.cancelRequest("r1", CancellationReason::UserCancelled).has_value());
    CHECK(token.isCompleted());
    CHECK(!token.isCancelled());
}

TEST_CASE("CancellationToken ends either completed or cancelled", "[cancellation]")
{
    auto completedFirst = CancellationToken {};
    auto called = false;
    completedFirst.onCancel([&](CancellationReason) { called = true; });
    CHECK(completedFirst.complete());
    CHECK(!completedFirst.complete());
    CHECK(!completedFirst.cancel(CancellationReason::UserCancelled));
    CHECK(!completedFirst.isCancelled());
    CHECK(completedFirst.checkCancelled().has_value());

    completedFirst.onCancel([&](CancellationReason) { called = true; });
    CHECK(!called);

    auto cancelledFirst = CancellationToken {};
    CHECK(cancelledFirst.cancel(CancellationReason::Timeout));
    CHECK(!cancelledFirst.complete());
    CHECK(!cancelledFirst.isCompleted());
}

TEST_CASE("CancellationManager cancel after completion reports nothing", "[cancellation]")
{
    auto manager = CancellationManager {};
    auto events = manager.subscribe();
    auto token = manager.registerRequest("r1", "fs", "tools/call").value();

    // The response has been delivered; the entry is still tracked until completeRequest().
    CHECK(token.complete());
    CHECK(!manager.cancelRequest("r1", CancellationReason::UserCancelled).has_value());
    CHECK(!manager.hasRequest("r1"));
    CHECK(!token.isCancelled());

    for (const auto& event: events.drain())
        CHECK(event.kind != CancellationEvent::Kind::RequestCancelled);
}

TEST_CASE("CancellationManager completeRequest loses against an earlier cancellation", "[cancellation]")
{
    auto manager = CancellationManager {};
    auto token = manager.registerRequest("r1", "fs", "tools/call").value();

    REQUIRE(manager.cancelRequest("r1", CancellationReason::UserCancelled).has_value());
    CHECK(!manager.completeRequest("r1", token));
    CHECK(token.reason() == CancellationReason::UserCancelled);
}

TEST_CASE("CancellationManager completeRequest leaves a newer registration alone", "[cancellation]")
{
    auto manager = CancellationManager {};
    auto first = manager.registerRequest("r1", "fs", "tools/call").value();
    REQUIRE(manager.cancelRequest("r1", CancellationReason::UserCancelled).has_value());

    auto second = manager.registerRequest("r1", "fs", "tools/call").value();
    CHECK(!manager.completeRequest("r1", first));
    CHECK(manager.hasRequest("r1"));

    CHECK(manager.completeRequest("r1", second));
    CHECK(!manager.hasRequest("r1"));
}

TEST_CASE("CancellationManager rejects an id that is still in flight", "[cancellation]")
{
    auto manager = CancellationManager {};
    auto first = manager.registerRequest("r1", "fs", "tools/call").value();

    auto second = manager.registerRequest("r1", "git", "tools/call");
    REQUIRE(!second.has_value());
    CHECK(second.error().code == ErrorCode::ValidationError);

    CHECK(!first.isCancelled());
    CHECK(manager.getAllRequests().size() == 1);
    CHECK(manager.getRequest("r1")->serverName == "fs");
}

TEST_CASE("CancellationManager cancels per server and globally", "[cancellation]")
{
    auto manager = CancellationManager {};
    auto events = manager.subscribe();

    auto a1 = manager.registerRequest("a1", "a", "tools/call").value();
    auto a2 = manager.registerRequest("a2", "a", "tools/call", 5s).value();
    auto b1 = manager.registerRequest("b1", "b", "resources/read").value();

    auto const stats = manager.stats();
    CHECK(stats.activeRequests == 3);
    CHECK(stats.byServer.at("a") == 2);
    CHECK(stats.withTimeout == 1);
    CHECK(manager.getServerRequests("a").size() == 2);

    auto const serverResults = manager.cancelServerRequests("a", CancellationReason::ServerRequest);
    CHECK(serverResults.size() == 2);
    CHECK(a1.isCancelled());
    CHECK(a2.isCancelled());
    CHECK(!b1.isCancelled());

    auto const allResults = manager.cancelAll(CancellationReason::Shutdown);
    CHECK(allResults.size() == 1);
    CHECK(b1.reason() == CancellationReason::Shutdown);
    CHECK(manager.stats().activeRequests == 0);

    auto sawServerCancelled = false;
    auto sawAllCancelled = false;
    for (const auto& event: events.drain())
    {
        if (event.kind == CancellationEvent::Kind::ServerCancelled)
        {
            sawServerCancelled = true;
            CHECK(event.serverName == "a");
            CHECK(event.count == 2);
        }
        if (event.kind == CancellationEvent::Kind::AllCancelled)
        {
            sawAllCancelled = true;
            CHECK(event.count == 1);
        }
    }
    CHECK(sawServerCancelled);
    CHECK(sawAllCancelled);
}

TEST_CASE("CancellationManager expires requests past their timeout", "[cancellation]")
{
    auto manager = CancellationManager {};
    auto quick = manager.registerRequest("quick", "fs", "tools/call", 1ms).value();
    auto patient = manager.registerRequest("patient", "fs", "tools/call", 1h).value();
    auto unbounded = manager.registerRequest("unbounded", "fs", "tools/call").value();

    std::this_thread::sleep_for(20ms);

    auto const expired = manager.cancelExpiredRequests();
    REQUIRE(expired.size() == 1);
    CHECK(expired.front().requestId == "quick");
    CHECK(quick.reason() == CancellationReason::Timeout);
    CHECK(!patient.isCancelled());
    CHECK(!unbounded.isCancelled());

    CHECK(manager.findLongRunningRequests(10ms).size() == 2);
    CHECK(manager.findLongRunningRequests(1h).empty());
    CHECK(manager.requestDurations().size() == 2);
}

TEST_CASE("CancellationManager cleanup forgets without cancelling", "[cancellation]")
{
    auto manager = CancellationManager {};
    auto token = manager.registerRequest("r1", "fs", "tools/call").value();
    manager.cleanup();
    CHECK(!manager.hasRequest("r1"));
    CHECK(!token.isCancelled());
}
