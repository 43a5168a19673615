// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/EventChannel.hpp>
#include <mcp/CancellationToken.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcprt
{

/// @brief An in-flight request tracked for cancellation.
struct CancellableRequest
{
    std::string id;
    std::string serverName;
    std::string method;
    std::chrono::steady_clock::time_point startTime;
    std::optional<std::chrono::milliseconds> timeout;
};

/// @brief Outcome of cancelling one request.
struct CancellationResult
{
    bool success = false;
    CancellationReason reason = CancellationReason::UserCancelled;
    std::string requestId;
    std::string serverName;
    std::chrono::milliseconds duration {};
};

/// @brief Event published by the CancellationManager.
struct CancellationEvent
{
    enum class Kind : std::uint8_t
    {
        RequestRegistered,
        RequestUnregistered,
        RequestCancelled,
        ServerCancelled,
        AllCancelled,
    };

    Kind kind = Kind::RequestRegistered;
    std::string requestId;
    std::string serverName;
    std::string method;

    /// @brief Set for RequestCancelled.
    std::optional<CancellationResult> result;

    /// @brief Number of cancelled requests, for ServerCancelled and AllCancelled.
    std::size_t count = 0;
};

/// @brief Snapshot of the requests currently tracked.
struct CancellationStats
{
    std::size_t activeRequests = 0;
    std::map<std::string, std::size_t> byServer;
    std::size_t withTimeout = 0;
};

/// @brief Elapsed time of one tracked request.
struct RequestDuration
{
    std::string id;
    std::string serverName;
    std::string method;
    std::chrono::milliseconds duration {};
};

/// @brief Registry of in-flight requests that can be cancelled individually, per server, or globally.
///
/// Completion and cancellation are mutually exclusive. The request's token records whichever
/// happens first, and the other becomes a no-op.
class CancellationManager
{
  public:
    CancellationManager();
    ~CancellationManager();

    CancellationManager(const CancellationManager&) = delete;
    CancellationManager& operator=(const CancellationManager&) = delete;

    /// @brief Subscribes to registration and cancellation events.
    [[nodiscard]] auto subscribe() -> EventChannel<CancellationEvent>::Receiver;

    /// @brief Starts tracking a request.
    /// @return The token that is cancelled when the request is, or a ValidationError if a
    ///         request with the same id is still tracked.
    [[nodiscard]] auto registerRequest(std::string id,
                                       std::string serverName,
                                       std::string method,
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<CancellationToken>;

    /// @brief Stops tracking a request that completed normally and completes its token.
    /// @return true if the request was tracked.
    auto unregisterRequest(std::string_view id) -> bool;

    /// @brief Claims completion for the request owning @p token and stops tracking it.
    ///
    /// The entry is only removed while it still belongs to @p token.
    /// @return true if completion won, false if the request had been cancelled first.
    auto completeRequest(std::string_view id, CancellationToken& token) -> bool;

    [[nodiscard]] auto hasRequest(std::string_view id) const -> bool;
    [[nodiscard]] auto getRequest(std::string_view id) const -> std::optional<CancellableRequest>;
    [[nodiscard]] auto getAllRequests() const -> std::vector<CancellableRequest>;
    [[nodiscard]] auto getServerRequests(std::string_view serverName) const -> std::vector<CancellableRequest>;

    /// @brief Cancels one request.
    /// @return The result, or std::nullopt if the id is not tracked or the request already completed.
    auto cancelRequest(std::string_view id, CancellationReason reason) -> std::optional<CancellationResult>;

    /// @brief Cancels every request of one server.
    auto cancelServerRequests(std::string_view serverName, CancellationReason reason)
        -> std::vector<CancellationResult>;

    /// @brief Cancels every tracked request.
    auto cancelAll(CancellationReason reason) -> std::vector<CancellationResult>;

    /// @brief Cancels the requests whose own timeout has elapsed, with CancellationReason::Timeout.
    auto cancelExpiredRequests() -> std::vector<CancellationResult>;

    [[nodiscard]] auto stats() const -> CancellationStats;
    [[nodiscard]] auto requestDurations() const -> std::vector<RequestDuration>;

    /// @brief Returns the requests that have been running longer than @p threshold.
    [[nodiscard]] auto findLongRunningRequests(std::chrono::milliseconds threshold) const
        -> std::vector<CancellableRequest>;

    /// @brief Forgets every tracked request without cancelling it.
    void cleanup();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcprt
