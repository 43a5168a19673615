// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <mcp/Transport.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string_view>

namespace mcprt
{

/// @brief Creates the transport for a server, keyed on its configured transport type.
///
/// The lifecycle supervisor only talks to transports through this hook, so tests can
/// substitute in-memory transports.
using TransportFactory =
    std::function<Result<std::unique_ptr<Transport>>(std::string_view serverName, const McpServerConfig& config)>;

/// @brief Creates a transport for @p config.
///
/// Only stdio servers are supported; other transport types yield a ConfigError.
/// @param config The server configuration.
/// @param shutdownTimeout Grace period granted to a child process on disconnect.
[[nodiscard]] auto createTransport(const McpServerConfig& config,
                                   std::chrono::milliseconds shutdownTimeout = std::chrono::seconds(10))
    -> Result<std::unique_ptr<Transport>>;

/// @brief Returns the factory used by default, which forwards to createTransport().
[[nodiscard]] auto defaultTransportFactory(std::chrono::milliseconds shutdownTimeout) -> TransportFactory;

} // namespace mcprt
