// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace mcprt;

namespace
{

/// @brief Restores the global log level when leaving a test.
struct LevelGuard
{
    log::Level saved = log::getLevel();
    ~LevelGuard() { log::setLevel(saved); }
};

} // namespace

TEST_CASE("log::parseLevel accepts names case-insensitively", "[log]")
{
    CHECK(log::parseLevel("error") == log::Level::Error);
    CHECK(log::parseLevel("WARN") == log::Level::Warning);
    CHECK(log::parseLevel("warning") == log::Level::Warning);
    CHECK(log::parseLevel("Info") == log::Level::Info);
    CHECK(log::parseLevel("debug") == log::Level::Debug);
    CHECK(log::parseLevel("trace") == log::Level::Trace);
    CHECK(!log::parseLevel("verbose").has_value());
}

TEST_CASE("log::levelName is accepted by parseLevel", "[log]")
{
    for (auto const level: { log::Level::Error, log::Level::Warning, log::Level::Info, log::Level::Debug, log::Level::Trace })
        CHECK(log::parseLevel(log::levelName(level)) == level);
}

TEST_CASE("log::ScopedCallback captures messages at or above the level", "[log]")
{
    auto const guard = LevelGuard {};
    log::setLevel(log::Level::Info);

    auto captured = std::vector<std::pair<log::Level, std::string>> {};
    {
        auto const scope = log::ScopedCallback([&](log::Level level, std::string_view message) {
            captured.emplace_back(level, std::string(message));
        });

        log::error("server '{}' crashed", "fs");
        log::info("started {} server(s)", 2);
        log::debug("hidden");
    }
    log::info("not captured");

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].first == log::Level::Error);
    CHECK(captured[0].second == "server 'fs' crashed");
    CHECK(captured[1].first == log::Level::Info);
    CHECK(captured[1].second == "started 2 server(s)");
}

TEST_CASE("log::ScopedCallback restores the enclosing callback", "[log]")
{
    auto const guard = LevelGuard {};
    log::setLevel(log::Level::Debug);
    CHECK(log::isEnabled(log::Level::Debug));
    CHECK(!log::isEnabled(log::Level::Trace));

    auto outer = std::vector<std::string> {};
    auto const outerScope =
        log::ScopedCallback([&](log::Level, std::string_view message) { outer.emplace_back(message); });

    {
        auto inner = std::vector<std::string> {};
        auto const innerScope =
            log::ScopedCallback([&](log::Level, std::string_view message) { inner.emplace_back(message); });
        log::debug("inner");
        CHECK(inner == std::vector<std::string> { "inner" });
    }

    log::debug("outer");
    CHECK(outer == std::vector<std::string> { "outer" });
}
