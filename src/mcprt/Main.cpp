// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <mcp/McpClient.hpp>
#include <mcprt/Config.hpp>

#include <CLI/CLI.hpp>

#include <format>
#include <print>
#include <string>
#include <vector>

#include <pthread.h>
#include <signal.h>
#include <time.h>

namespace
{

auto lifecycleEventName(mcprt::LifecycleEvent::Kind kind) -> std::string_view
{
    using Kind = mcprt::LifecycleEvent::Kind;
    switch (kind)
    {
        case Kind::Starting: return "starting";
        case Kind::Started: return "started";
        case Kind::Stopping: return "stopping";
        case Kind::Stopped: return "stopped";
        case Kind::Error: return "error";
        case Kind::Crashed: return "crashed";
        case Kind::Restarting: return "restarting";
        case Kind::HealthOk: return "healthy";
        case Kind::HealthFailed: return "unhealthy";
    }
    return "unknown";
}

auto printValidation(const mcprt::AppConfig& config) -> bool
{
    auto valid = true;
    for (const auto& [name, report]: mcprt::validateConfig(config, true))
    {
        std::println("{}: {}", name, report.valid ? "ok" : "invalid");
        for (const auto& error: report.errors)
            std::println("  error: {}", error);
        for (const auto& warning: report.warnings)
            std::println("  warning: {}", warning);
        valid = valid && report.valid;
    }
    return valid;
}

void printStatus(mcprt::LifecycleManager& lifecycle)
{
    for (const auto& process: lifecycle.getAllProcesses())
    {
        auto line = std::format("{:<24} {:<9}", process.name, mcprt::serverStateName(process.state));
        if (process.pid)
            line += std::format(" pid={}", *process.pid);
        if (process.restartCount > 0)
            line += std::format(" restarts={}", process.restartCount);
        if (process.lastError)
            line += std::format(" error=\"{}\"", *process.lastError);
        std::println("{}", line);
    }
}

/// @brief Blocks SIGINT and SIGTERM. Must run before any thread is spawned so that all threads inherit the mask.
auto blockTerminationSignals() -> sigset_t
{
    auto signals = sigset_t {};
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    return signals;
}

/// @brief Waits for one of @p signals, logging lifecycle events meanwhile.
void runUntilSignalled(mcprt::LifecycleManager& lifecycle, const sigset_t& signals)
{
    auto events = lifecycle.subscribe();
    auto const timeout = timespec { .tv_sec = 0, .tv_nsec = 200'000'000 };
    while (sigtimedwait(&signals, nullptr, &timeout) < 0)
    {
        for (auto const& event: events.drain())
        {
            mcprt::log::info("[{}] {}{}",
                             event.serverName,
                             lifecycleEventName(event.kind),
                             event.reason ? std::format(": {}", *event.reason) : std::string {});
        }
    }
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "mcprt - supervises MCP servers and routes their messages" };

    auto configPath = std::string {};
    auto verbose = false;
    auto validateOnly = false;
    auto printConfig = false;
    auto watch = false;
    auto timestamps = false;
    auto servers = std::vector<std::string> {};

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-s,--server", servers, "Start only these servers (and their dependencies)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--validate", validateOnly, "Validate the config file and exit");
    app.add_flag("--print-config", printConfig, "Print the effective config with secrets masked and exit");
    app.add_flag("-w,--watch", watch, "Keep servers running until interrupted");
    app.add_flag("--timestamps", timestamps, "Prefix log lines with a UTC timestamp");

    CLI11_PARSE(app, argc, argv);

    mcprt::log::setTimestamps(timestamps);

    // Load config
    auto configResult = configPath.empty() ? mcprt::loadConfig() : mcprt::loadConfigFromFile(configPath);

    if (!configResult)
    {
        mcprt::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    mcprt::log::setLevel(verbose ? mcprt::log::Level::Debug : config.logLevel);

    if (printConfig)
    {
        std::println("{}", mcprt::configToJson(config, true).dump(4));
        return 0;
    }

    if (validateOnly)
        return printValidation(config) ? 0 : 1;

    auto const signals = watch ? blockTerminationSignals() : sigset_t {};

    auto client = mcprt::McpClient(mcprt::McpClientOptions {
        .lifecycle = config.lifecycle,
        .notificationHistorySize = config.notificationHistorySize,
    });

    for (auto& [name, server]: config.mcpServers)
        client.addServer(name, std::move(server));

    auto exitCode = 0;
    if (servers.empty())
    {
        if (auto result = client.startAll(); !result)
        {
            mcprt::log::error("{}", result.error().message);
            exitCode = 1;
        }
    }
    else
    {
        for (const auto& name: servers)
        {
            if (auto result = client.lifecycle().startWithDependencies(name); !result)
            {
                mcprt::log::error("{}", result.error().message);
                exitCode = 1;
            }
            else if (auto initResult = client.initialize(name); !initResult)
            {
                mcprt::log::error("Failed to initialize '{}': {}", name, initResult.error().message);
                exitCode = 1;
            }
        }
    }

    printStatus(client.lifecycle());

    if (watch)
    {
        runUntilSignalled(client.lifecycle(), signals);
        printStatus(client.lifecycle());
    }

    if (auto result = client.stopAll(); !result)
    {
        mcprt::log::error("{}", result.error().message);
        exitCode = 1;
    }

    return exitCode;
}
