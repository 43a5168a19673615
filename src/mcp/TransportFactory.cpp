// SPDX-License-Identifier: Apache-2.0
#include "TransportFactory.hpp"

#include <mcp/StdioTransport.hpp>

#include <format>

namespace mcprt
{

auto createTransport(const McpServerConfig& config, std::chrono::milliseconds shutdownTimeout)
    -> Result<std::unique_ptr<Transport>>
{
    switch (config.transportType)
    {
        case TransportType::Stdio: {
            if (config.command.empty())
                return makeError(ErrorCode::ConfigError, "Stdio server requires a command");

            auto transportConfig = StdioTransportConfig {
                .command = config.command,
                .args = config.args,
                .env = config.env,
                .cwd = config.cwd,
                .shutdownTimeout = shutdownTimeout,
            };
            return std::make_unique<StdioTransport>(std::move(transportConfig));
        }
        case TransportType::Http:
        case TransportType::Sse:
        case TransportType::WebSocket: break;
    }

    return makeError(ErrorCode::ConfigError,
                     std::format("Unsupported transport type: {}", transportTypeName(config.transportType)));
}

auto defaultTransportFactory(std::chrono::milliseconds shutdownTimeout) -> TransportFactory
{
    return [shutdownTimeout](std::string_view /*serverName*/, const McpServerConfig& config) {
        return createTransport(config, shutdownTimeout);
    };
}

} // namespace mcprt
