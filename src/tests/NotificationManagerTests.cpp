// SPDX-License-Identifier: Apache-2.0
#include <mcp/NotificationManager.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <format>

using namespace mcprt;

namespace
{

auto countEvents(const std::vector<NotificationEvent>& events, NotificationEvent::Kind kind) -> std::size_t
{
    return static_cast<std::size_t>(
        std::ranges::count_if(events, [kind](const NotificationEvent& event) { return event.kind == kind; }));
}

} // namespace

TEST_CASE("NotificationManager classifies methods", "[notifications]")
{
    CHECK(NotificationManager::classify("notifications/progress") == NotificationType::Progress);
    CHECK(NotificationManager::classify("notifications/cancelled") == NotificationType::Cancelled);
    CHECK(NotificationManager::classify("notifications/resources/list_changed")
          == NotificationType::ResourcesListChanged);
    CHECK(NotificationManager::classify("notifications/resources/updated") == NotificationType::ResourcesUpdated);
    CHECK(NotificationManager::classify("notifications/tools/list_changed") == NotificationType::ToolsListChanged);
    CHECK(NotificationManager::classify("notifications/prompts/list_changed") == NotificationType::PromptsListChanged);
    CHECK(NotificationManager::classify("notifications/roots/list_changed") == NotificationType::RootsListChanged);
    CHECK(NotificationManager::classify("custom/thing") == NotificationType::Custom);
}

TEST_CASE("NotificationManager tracks progress until complete", "[notifications]")
{
    auto manager = NotificationManager {};
    auto events = manager.subscribe();

    manager.handleNotification("fs", "notifications/progress", { { "progressToken", "t1" }, { "progress", 50 }, { "total", 100 } });

    auto active = manager.activeProgress();
    REQUIRE(active.size() == 1);
    CHECK(active.front().token == "t1");
    CHECK(active.front().serverName == "fs");
    CHECK(active.front().progress == 50.0);
    CHECK(active.front().total == 100.0);

    manager.handleNotification("fs", "notifications/progress", { { "progressToken", "t1" }, { "progress", 100 }, { "total", 100 } });
    CHECK(manager.activeProgress().empty());

    auto const received = events.drain();
    CHECK(countEvents(received, NotificationEvent::Kind::Notification) == 2);
    CHECK(countEvents(received, NotificationEvent::Kind::Progress) == 2);
    CHECK(countEvents(received, NotificationEvent::Kind::ProgressComplete) == 1);
}

TEST_CASE("NotificationManager treats 100 as complete only without a total", "[notifications]")
{
    auto manager = NotificationManager {};

    manager.handleNotification("fs", "notifications/progress", { { "progressToken", 7 }, { "progress", 100 }, { "total", 200 } });
    REQUIRE(manager.activeProgress().size() == 1);
    CHECK(manager.activeProgress().front().token == "7");

    manager.handleNotification("fs", "notifications/progress", { { "progressToken", "t2" }, { "progress", 100 } });
    CHECK(manager.serverProgress("fs").size() == 1);
}

TEST_CASE("NotificationManager keys progress by server and token", "[notifications]")
{
    auto manager = NotificationManager {};

    manager.handleNotification("a", "notifications/progress", { { "progressToken", "t" }, { "progress", 1 } });
    manager.handleNotification("b", "notifications/progress", { { "progressToken", "t" }, { "progress", 2 } });

    CHECK(manager.activeProgress().size() == 2);
    CHECK(manager.serverProgress("a").size() == 1);

    CHECK(manager.cancelProgress("a", "t"));
    CHECK(!manager.cancelProgress("a", "t"));
    CHECK(manager.activeProgress().size() == 1);

    manager.clearProgress();
    CHECK(manager.activeProgress().empty());
}

TEST_CASE("NotificationManager keeps separator characters apart in progress keys", "[notifications]")
{
    auto manager = NotificationManager {};
    auto events = manager.subscribe();

    manager.handleNotification("a:b", "notifications/progress", { { "progressToken", "c" }, { "progress", 10 }, { "total", 20 } });
    manager.handleNotification("a", "notifications/progress", { { "progressToken", "b:c" }, { "progress", 5 }, { "total", 20 } });

    REQUIRE(manager.activeProgress().size() == 2);
    REQUIRE(manager.serverProgress("a:b").size() == 1);
    CHECK(manager.serverProgress("a:b").front().progress == 10.0);
    REQUIRE(manager.serverProgress("a").size() == 1);
    CHECK(manager.serverProgress("a").front().token == "b:c");

    // Completing one leaves the other in place.
    manager.handleNotification("a", "notifications/progress", { { "progressToken", "b:c" }, { "progress", 20 }, { "total", 20 } });
    REQUIRE(manager.activeProgress().size() == 1);
    CHECK(manager.activeProgress().front().serverName == "a:b");
    CHECK(countEvents(events.drain(), NotificationEvent::Kind::ProgressComplete) == 1);
}

TEST_CASE("NotificationManager history is bounded", "[notifications]")
{
    auto manager = NotificationManager(3);

    for (auto i = 0; i < 5; ++i)
        manager.handleNotification("fs", "custom/event", { { "index", i } });

    auto const history = manager.getHistory();
    REQUIRE(history.size() == 3);
    CHECK(history.front().params["index"] == 2);
    CHECK(history.back().params["index"] == 4);
    CHECK(manager.stats().maxHistorySize == 3);
}

TEST_CASE("NotificationManager filters history", "[notifications]")
{
    auto manager = NotificationManager {};
    manager.handleNotification("a", "notifications/tools/list_changed", nullptr);
    manager.handleNotification("b", "notifications/tools/list_changed", nullptr);
    manager.handleNotification("a", "custom/x", nullptr);
    manager.handleNotification("a", "custom/y", nullptr);

    CHECK(manager.getHistory({ .serverName = "a" }).size() == 3);
    CHECK(manager.getHistory({ .type = NotificationType::ToolsListChanged }).size() == 2);

    auto const limited = manager.getHistory({ .serverName = "a", .limit = 2 });
    REQUIRE(limited.size() == 2);
    CHECK(limited.back().method == "custom/y");

    auto const stats = manager.stats();
    CHECK(stats.totalNotifications == 4);
    CHECK(stats.byServer.at("a") == 3);
    CHECK(stats.byType.at(NotificationType::Custom) == 2);

    CHECK(manager.clearServerHistory("a") == 3);
    CHECK(manager.getHistory().size() == 1);

    auto events = manager.subscribe();
    manager.clearHistory();
    CHECK(manager.getHistory().empty());

    auto const cleared = events.tryReceive();
    REQUIRE(cleared.has_value());
    CHECK(cleared->kind == NotificationEvent::Kind::HistoryCleared);
    CHECK(cleared->count == 1);
}

TEST_CASE("NotificationManager publishes derived events", "[notifications]")
{
    auto manager = NotificationManager {};
    auto events = manager.subscribe();

    manager.handleNotification("fs", "notifications/resources/list_changed", nullptr);
    manager.handleNotification("fs", "notifications/resources/updated", { { "uri", "file:///a.txt" } });
    manager.handleNotification("fs", "notifications/cancelled", { { "requestId", 12 }, { "reason", "user" } });

    auto const received = events.drain();

    auto const listChanged = std::ranges::find_if(
        received, [](const NotificationEvent& event) { return event.kind == NotificationEvent::Kind::ListChanged; });
    REQUIRE(listChanged != received.end());
    CHECK(listChanged->listType == NotificationType::ResourcesListChanged);

    auto const updated = std::ranges::find_if(
        received, [](const NotificationEvent& event) { return event.kind == NotificationEvent::Kind::ResourceUpdated; });
    REQUIRE(updated != received.end());
    CHECK(updated->uri == "file:///a.txt");

    auto const cancelled = std::ranges::find_if(
        received, [](const NotificationEvent& event) { return event.kind == NotificationEvent::Kind::Cancelled; });
    REQUIRE(cancelled != received.end());
    CHECK(cancelled->requestId == "12");
    CHECK(cancelled->reason == "user");
}

TEST_CASE("NotificationManager records notifications without params", "[notifications]")
{
    auto manager = NotificationManager {};
    manager.handleNotification("fs", "notifications/progress", nullptr);

    auto const history = manager.getHistory();
    REQUIRE(history.size() == 1);
    CHECK(history.front().type == NotificationType::Progress);
    CHECK(manager.activeProgress().empty());
    CHECK(std::format("{}", notificationTypeName(history.front().type)) == "progress");
}
