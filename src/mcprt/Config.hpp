// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcprt
{

/// @brief Top-level application configuration.
struct AppConfig
{
    log::Level logLevel = log::Level::Info;
    LifecycleOptions lifecycle;
    std::size_t notificationHistorySize = 100;
    std::map<std::string, McpServerConfig> mcpServers;
};

/// @brief Problems found in a server configuration.
struct ValidationReport
{
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(std::string message)
    {
        valid = false;
        errors.push_back(std::move(message));
    }

    void addWarning(std::string message) { warnings.push_back(std::move(message)); }
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Builds the application configuration from a parsed JSON document.
[[nodiscard]] auto parseConfig(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Serializes the application configuration.
/// @param config The configuration.
/// @param maskSecrets Replace values of secret-looking env and header keys with a mask.
[[nodiscard]] auto configToJson(const AppConfig& config, bool maskSecrets = false) -> nlohmann::json;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Parses a duration given as milliseconds or as a string such as "250ms", "30s", "5m" or "1h".
[[nodiscard]] auto parseDuration(const nlohmann::json& value) -> Result<std::chrono::milliseconds>;

/// @brief Formats a duration in the largest unit that represents it exactly.
[[nodiscard]] auto formatDuration(std::chrono::milliseconds duration) -> std::string;

/// @brief Checks a single server configuration.
/// @param config The server configuration.
/// @param checkCommand Warn if a stdio command cannot be found on PATH.
[[nodiscard]] auto validateServerConfig(const McpServerConfig& config, bool checkCommand = false)
    -> ValidationReport;

/// @brief Checks every server, including that dependencies name configured servers.
/// @return One report per server, keyed by server name.
[[nodiscard]] auto validateConfig(const AppConfig& config, bool checkCommands = false)
    -> std::map<std::string, ValidationReport>;

/// @brief Returns true if @p command is an existing path or found in a PATH directory.
[[nodiscard]] auto commandExists(std::string_view command) -> bool;

/// @brief Returns true if an env or header key looks like it holds a credential.
[[nodiscard]] auto isSensitiveKey(std::string_view key) -> bool;

/// @brief Masks a secret, keeping the first and last four characters of long values.
[[nodiscard]] auto maskSecret(std::string_view value) -> std::string;

/// @brief Returns the default config directory path.
/// On Linux: $XDG_CONFIG_HOME/mcprt or ~/.config/mcprt
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace mcprt
