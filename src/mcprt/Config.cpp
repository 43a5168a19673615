// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <set>
#include <sstream>

#include <unistd.h>

namespace mcprt
{

namespace
{

    constexpr auto SensitiveKeyParts =
        std::array<std::string_view, 6> { "key", "token", "secret", "password", "auth", "credential" };

    /// @brief Reads an optional duration member, falling back to @p defaultValue.
    auto readDuration(const nlohmann::json& obj, std::string_view key, std::chrono::milliseconds defaultValue)
        -> Result<std::chrono::milliseconds>
    {
        auto const it = obj.find(std::string(key));
        if (it == obj.end())
            return defaultValue;

        auto duration = parseDuration(*it);
        if (!duration)
            return makeError(ErrorCode::ConfigError, std::format("Invalid '{}': {}", key, duration.error().message));
        return duration;
    }

    auto parseServer(std::string_view name, const nlohmann::json& serverJson) -> Result<McpServerConfig>
    {
        if (!serverJson.is_object())
            return makeError(ErrorCode::ConfigError, std::format("Server '{}' must be an object", name));

        auto const typeName = json::getStringOr(serverJson, "type", "stdio");
        auto const transportType = parseTransportType(typeName);
        if (!transportType)
        {
            return makeError(ErrorCode::ConfigError,
                             std::format("Server '{}': unknown transport type '{}'", name, typeName));
        }

        auto timeout = readDuration(serverJson, "timeout", std::chrono::seconds(30));
        if (!timeout)
            return makeError(ErrorCode::ConfigError, std::format("Server '{}': {}", name, timeout.error().message));

        return McpServerConfig {
            .transportType = *transportType,
            .command = json::getStringOr(serverJson, "command", ""),
            .args = json::getStringList(serverJson, "args"),
            .env = json::getStringMap(serverJson, "env"),
            .cwd = json::getStringOr(serverJson, "cwd", ""),
            .url = json::getStringOr(serverJson, "url", ""),
            .headers = json::getStringMap(serverJson, "headers"),
            .enabled = json::getBoolOr(serverJson, "enabled", true),
            .timeout = *timeout,
            .retries = json::getIntOr(serverJson, "retries", 3),
            .autoApprove = json::getStringList(serverJson, "autoApprove"),
            .logLevel = parseServerLogLevel(json::getStringOr(serverJson, "logLevel", "info")),
            .dependsOn = json::getStringList(serverJson, "dependsOn"),
        };
    }

    auto parseLifecycle(const nlohmann::json& section) -> Result<LifecycleOptions>
    {
        auto const defaults = LifecycleOptions {};
        auto options = LifecycleOptions {};

        auto assign = [&](std::string_view key, std::chrono::milliseconds defaultValue, std::chrono::milliseconds& target)
            -> VoidResult {
            return readDuration(section, key, defaultValue).transform([&](std::chrono::milliseconds value) {
                target = value;
            });
        };

        if (auto result = assign("startupTimeout", defaults.startupTimeout, options.startupTimeout); !result)
            return std::unexpected(result.error());
        if (auto result = assign("shutdownTimeout", defaults.shutdownTimeout, options.shutdownTimeout); !result)
            return std::unexpected(result.error());
        if (auto result = assign("restartDelay", defaults.restartDelay, options.restartDelay); !result)
            return std::unexpected(result.error());
        if (auto result = assign("healthCheckInterval", defaults.healthCheckInterval, options.healthCheckInterval);
            !result)
            return std::unexpected(result.error());

        options.maxRestarts = json::getIntOr(section, "maxRestarts", defaults.maxRestarts);
        options.maxConsecutiveFailures =
            json::getIntOr(section, "maxConsecutiveFailures", defaults.maxConsecutiveFailures);
        options.autoRestart = json::getBoolOr(section, "autoRestart", defaults.autoRestart);
        options.healthChecks = json::getBoolOr(section, "healthChecks", defaults.healthChecks);
        options.pingOnHealthCheck = json::getBoolOr(section, "pingOnHealthCheck", defaults.pingOnHealthCheck);

        if (options.maxRestarts < 0 || options.maxConsecutiveFailures < 1)
            return makeError(ErrorCode::ConfigError, "lifecycle: restart limits must not be negative");

        if (options.healthCheckInterval <= std::chrono::milliseconds::zero())
            return makeError(ErrorCode::ConfigError, "lifecycle: healthCheckInterval must be positive");

        return options;
    }

    auto serverToJson(const McpServerConfig& server, bool maskSecrets) -> nlohmann::json
    {
        auto maskMap = [maskSecrets](const std::map<std::string, std::string>& values) {
            auto result = nlohmann::json::object();
            for (const auto& [key, value]: values)
                result[key] = maskSecrets && isSensitiveKey(key) ? maskSecret(value) : value;
            return result;
        };

        auto result = nlohmann::json::object();
        result["type"] = transportTypeName(server.transportType);
        if (server.transportType == TransportType::Stdio)
        {
            result["command"] = server.command;
            if (!server.args.empty())
                result["args"] = server.args;
            if (!server.env.empty())
                result["env"] = maskMap(server.env);
            if (!server.cwd.empty())
                result["cwd"] = server.cwd;
        }
        else
        {
            result["url"] = server.url;
            if (!server.headers.empty())
                result["headers"] = maskMap(server.headers);
        }

        result["enabled"] = server.enabled;
        result["timeout"] = formatDuration(server.timeout);
        result["retries"] = server.retries;
        if (!server.autoApprove.empty())
            result["autoApprove"] = server.autoApprove;
        result["logLevel"] = serverLogLevelName(server.logLevel);
        if (!server.dependsOn.empty())
            result["dependsOn"] = server.dependsOn;
        return result;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/mcprt";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/mcprt";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseDuration(const nlohmann::json& value) -> Result<std::chrono::milliseconds>
{
    if (value.is_number_integer())
    {
        auto const milliseconds = value.get<std::int64_t>();
        if (milliseconds < 0)
            return makeError(ErrorCode::ConfigError, "Duration must not be negative");
        return std::chrono::milliseconds(milliseconds);
    }

    if (!value.is_string())
        return makeError(ErrorCode::ConfigError, "Duration must be a number of milliseconds or a string");

    auto const text = value.get<std::string>();
    auto amount = std::int64_t { 0 };
    auto const* const begin = text.data();
    auto const* const end = text.data() + text.size();
    auto const [rest, ec] = std::from_chars(begin, end, amount);
    if (ec != std::errc {} || rest == begin || amount < 0)
        return makeError(ErrorCode::ConfigError, std::format("Invalid duration: '{}'", text));

    auto const unit = std::string_view(rest, end);
    if (unit == "ms" || unit.empty())
        return std::chrono::milliseconds(amount);
    if (unit == "s")
        return std::chrono::milliseconds(std::chrono::seconds(amount));
    if (unit == "m" || unit == "min")
        return std::chrono::milliseconds(std::chrono::minutes(amount));
    if (unit == "h")
        return std::chrono::milliseconds(std::chrono::hours(amount));

    return makeError(ErrorCode::ConfigError, std::format("Invalid duration unit in '{}'", text));
}

auto formatDuration(std::chrono::milliseconds duration) -> std::string
{
    auto const count = duration.count();
    if (count != 0 && count % 3'600'000 == 0)
        return std::format("{}h", count / 3'600'000);
    if (count != 0 && count % 60'000 == 0)
        return std::format("{}m", count / 60'000);
    if (count != 0 && count % 1000 == 0)
        return std::format("{}s", count / 1000);
    return std::format("{}ms", count);
}

auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be an object");

    auto config = AppConfig {};

    if (root.contains("logLevel"))
    {
        auto const levelName = json::getStringOr(root, "logLevel", "info");
        auto const level = log::parseLevel(levelName);
        if (!level)
            return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", levelName));
        config.logLevel = *level;
    }

    if (auto const size = json::getUInt(root, "notificationHistorySize"))
        config.notificationHistorySize = static_cast<std::size_t>(*size);

    // Lifecycle section
    if (auto const it = root.find("lifecycle"); it != root.end())
    {
        if (!it->is_object())
            return makeError(ErrorCode::ConfigError, "'lifecycle' must be an object");

        auto lifecycle = parseLifecycle(*it);
        if (!lifecycle)
            return std::unexpected(lifecycle.error());
        config.lifecycle = *lifecycle;
    }

    // MCP servers section
    if (auto const it = root.find("mcpServers"); it != root.end())
    {
        if (!it->is_object())
            return makeError(ErrorCode::ConfigError, "'mcpServers' must be an object");

        for (const auto& [name, serverJson]: it->items())
        {
            auto server = parseServer(name, serverJson);
            if (!server)
                return std::unexpected(server.error());
            config.mcpServers[name] = std::move(*server);
        }
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    return json::parse(ss.str()).and_then([](const nlohmann::json& root) { return parseConfig(root); });
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto configToJson(const AppConfig& config, bool maskSecrets) -> nlohmann::json
{
    auto root = nlohmann::json::object();
    root["logLevel"] = log::levelName(config.logLevel);
    root["notificationHistorySize"] = config.notificationHistorySize;

    // Lifecycle section
    auto const& options = config.lifecycle;
    root["lifecycle"] = nlohmann::json {
        { "startupTimeout", formatDuration(options.startupTimeout) },
        { "shutdownTimeout", formatDuration(options.shutdownTimeout) },
        { "maxRestarts", options.maxRestarts },
        { "restartDelay", formatDuration(options.restartDelay) },
        { "healthCheckInterval", formatDuration(options.healthCheckInterval) },
        { "maxConsecutiveFailures", options.maxConsecutiveFailures },
        { "autoRestart", options.autoRestart },
        { "healthChecks", options.healthChecks },
        { "pingOnHealthCheck", options.pingOnHealthCheck },
    };

    // MCP servers section
    auto servers = nlohmann::json::object();
    for (const auto& [name, server]: config.mcpServers)
        servers[name] = serverToJson(server, maskSecrets);
    root["mcpServers"] = std::move(servers);

    return root;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << configToJson(config).dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write config file: {}", path));
    return {};
}

auto commandExists(std::string_view command) -> bool
{
    if (command.empty())
        return false;

    if (command.find('/') != std::string_view::npos)
        return ::access(std::string(command).c_str(), X_OK) == 0;

    auto const* const pathEnv = std::getenv("PATH");
    if (!pathEnv)
        return false;

    auto paths = std::istringstream(pathEnv);
    auto directory = std::string {};
    while (std::getline(paths, directory, ':'))
    {
        if (directory.empty())
            directory = ".";
        auto const candidate = std::filesystem::path(directory) / command;
        if (::access(candidate.c_str(), X_OK) == 0)
            return true;
    }
    return false;
}

auto isSensitiveKey(std::string_view key) -> bool
{
    auto lower = std::string(key);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return std::ranges::any_of(SensitiveKeyParts,
                               [&](std::string_view part) { return lower.find(part) != std::string::npos; });
}

auto maskSecret(std::string_view value) -> std::string
{
    if (value.size() <= 8)
        return "***";
    return std::format("{}***{}", value.substr(0, 4), value.substr(value.size() - 4));
}

auto validateServerConfig(const McpServerConfig& config, bool checkCommand) -> ValidationReport
{
    auto report = ValidationReport {};

    if (config.transportType == TransportType::Stdio)
    {
        if (config.command.empty())
            report.addError("Stdio transport requires a command");
        else if (checkCommand && !commandExists(config.command))
            report.addWarning(std::format("Command not found: {}", config.command));
    }
    else
    {
        if (config.url.empty())
            report.addError(std::format("{} transport requires a URL", transportTypeName(config.transportType)));
        report.addWarning(
            std::format("{} transport is not supported by this runtime", transportTypeName(config.transportType)));
    }

    if (config.timeout == std::chrono::milliseconds::zero())
        report.addWarning("Timeout is set to 0, which may cause issues");

    for (const auto& [key, value]: config.env)
    {
        if (value.empty())
            report.addWarning(std::format("Environment variable '{}' is empty", key));
    }

    return report;
}

auto validateConfig(const AppConfig& config, bool checkCommands) -> std::map<std::string, ValidationReport>
{
    auto reports = std::map<std::string, ValidationReport> {};
    for (const auto& [name, server]: config.mcpServers)
    {
        auto report = validateServerConfig(server, checkCommands);

        auto seen = std::set<std::string> {};
        for (const auto& dependency: server.dependsOn)
        {
            if (dependency == name)
                report.addError("Server depends on itself");
            else if (!config.mcpServers.contains(dependency))
                report.addError(std::format("Unknown dependency '{}'", dependency));
            else if (!seen.insert(dependency).second)
                report.addWarning(std::format("Dependency '{}' is listed twice", dependency));
        }

        reports.emplace(name, std::move(report));
    }
    return reports;
}

} // namespace mcprt
