// SPDX-License-Identifier: Apache-2.0
#include <core/EventChannel.hpp>

#include <catch2/catch_test_macros.hpp>

#include <thread>

using namespace mcprt;
using namespace std::chrono_literals;

TEST_CASE("EventChannel delivers to every subscriber", "[events]")
{
    auto channel = EventChannel<int> {};
    auto first = channel.subscribe();
    auto second = channel.subscribe();

    channel.publish(1);
    channel.publish(2);

    CHECK(first.drain() == std::vector { 1, 2 });
    CHECK(second.tryReceive() == 1);
    CHECK(second.tryReceive() == 2);
    CHECK(!second.tryReceive().has_value());
}

TEST_CASE("EventChannel subscribers only see later events", "[events]")
{
    auto channel = EventChannel<int> {};
    channel.publish(1);

    auto receiver = channel.subscribe();
    channel.publish(2);

    CHECK(receiver.drain() == std::vector { 2 });
}

TEST_CASE("EventChannel drops the oldest event of a full subscriber", "[events]")
{
    auto channel = EventChannel<int>(2);
    auto receiver = channel.subscribe();

    channel.publish(1);
    channel.publish(2);
    channel.publish(3);

    CHECK(receiver.dropped() == 1);
    CHECK(receiver.drain() == std::vector { 2, 3 });
}

TEST_CASE("EventChannel prunes destroyed subscribers", "[events]")
{
    auto channel = EventChannel<int> {};
    {
        auto receiver = channel.subscribe();
        CHECK(channel.subscriberCount() == 1);
    }
    channel.publish(1);
    CHECK(channel.subscriberCount() == 0);
}

TEST_CASE("EventChannel receive wakes up on publish", "[events]")
{
    auto channel = EventChannel<int> {};
    auto receiver = channel.subscribe();

    auto publisher = std::jthread([&] {
        std::this_thread::sleep_for(20ms);
        channel.publish(42);
    });

    CHECK(receiver.receive(5s) == 42);
}

TEST_CASE("EventChannel receive times out without events", "[events]")
{
    auto channel = EventChannel<int> {};
    auto receiver = channel.subscribe();
    CHECK(!receiver.receive(10ms).has_value());
}
