// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcprt
{

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// @brief Working directory of the child; empty means the current directory.
    std::string cwd;

    /// @brief Time the child gets to exit once its input is closed, before it is signalled.
    std::chrono::milliseconds shutdownTimeout = std::chrono::seconds(10);
};

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Spawns a child process and exchanges newline-delimited JSON over its stdin/stdout.
/// A writer thread serializes outbound messages, a reader thread correlates responses
/// and publishes everything else, and the child's stderr is forwarded to the debug log.
class StdioTransport: public Transport
{
  public:
    explicit StdioTransport(StdioTransportConfig config);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    using Transport::sendRequest;

    [[nodiscard]] auto type() const -> TransportType override;
    [[nodiscard]] auto connect() -> VoidResult override;
    void disconnect() override;
    void terminate() override;
    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto sendRequest(const jsonrpc::Request& request,
                                   std::chrono::milliseconds timeout,
                                   CancellationToken token) -> Result<jsonrpc::Response> override;
    [[nodiscard]] auto subscribe() -> EventChannel<TransportEvent>::Receiver override;
    [[nodiscard]] auto state() const -> TransportState override;
    [[nodiscard]] auto processId() const -> std::optional<int> override;

    /// @brief Generates a fresh request id of the form "req-N".
    [[nodiscard]] auto nextRequestId() -> std::string;

    /// @brief Returns the number of requests still waiting for a response.
    [[nodiscard]] auto pendingRequestCount() const -> std::size_t;

    [[nodiscard]] auto config() const -> const StdioTransportConfig&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcprt
