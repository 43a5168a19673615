// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace mcprt
{

/// @brief Why a request was cancelled.
enum class CancellationReason : std::uint8_t
{
    UserCancelled,
    Timeout,
    ServerRequest,
    Shutdown,
    Error,
};

/// @brief Returns the human-readable description of a cancellation reason.
[[nodiscard]] constexpr auto describe(CancellationReason reason) -> std::string_view
{
    switch (reason)
    {
        case CancellationReason::UserCancelled: return "Request cancelled by user";
        case CancellationReason::Timeout: return "Request timed out";
        case CancellationReason::ServerRequest: return "Cancelled at server request";
        case CancellationReason::Shutdown: return "Cancelled due to shutdown";
        case CancellationReason::Error: return "Cancelled due to error";
    }
    return "Cancelled";
}

/// @brief Shared, copyable one-shot cancellation signal.
///
/// All copies observe the same state. A token ends either cancelled or completed, never both:
/// the first call to cancel() or complete() wins and later calls are no-ops.
class CancellationToken
{
  public:
    /// @brief Handle identifying a registered callback.
    using CallbackId = std::uint64_t;

    /// @brief Creates a fresh, uncancelled token.
    CancellationToken();

    /// @brief Marks the token cancelled and runs the registered callbacks.
    /// @return true if this call performed the transition, false if the token was already cancelled
    ///         or completed.
    auto cancel(CancellationReason reason) -> bool;

    /// @brief Marks the work guarded by this token as finished. Registered callbacks are dropped.
    /// @return true if this call performed the transition, false if the token was already cancelled
    ///         or completed.
    auto complete() -> bool;

    [[nodiscard]] auto isCompleted() const -> bool;

    [[nodiscard]] auto isCancelled() const -> bool;

    /// @brief Returns the reason, once cancelled.
    [[nodiscard]] auto reason() const -> std::optional<CancellationReason>;

    /// @brief Returns when the token was cancelled, once cancelled.
    [[nodiscard]] auto cancelledAt() const -> std::optional<std::chrono::steady_clock::time_point>;

    /// @brief Returns a CancelledError if the token has been cancelled.
    [[nodiscard]] auto checkCancelled() const -> VoidResult;

    /// @brief Registers a callback that runs once when the token is cancelled.
    ///
    /// If the token is already cancelled, the callback runs immediately on the calling thread.
    /// On a completed token the callback is never run.
    /// Callbacks must not call back into the same token.
    /// @return An id for removeCallback().
    auto onCancel(std::function<void(CancellationReason)> callback) -> CallbackId;

    /// @brief Unregisters a callback. Blocks while the callback is running on another thread.
    void removeCallback(CallbackId id);

    /// @brief Returns true if both tokens share the same state.
    [[nodiscard]] auto operator==(const CancellationToken& other) const -> bool
    {
        return _state == other._state;
    }

  private:
    struct State;
    std::shared_ptr<State> _state;
};

} // namespace mcprt
