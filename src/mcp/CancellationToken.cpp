// SPDX-License-Identifier: Apache-2.0
#include "CancellationToken.hpp"

#include <format>
#include <map>
#include <mutex>

namespace mcprt
{

struct CancellationToken::State
{
    mutable std::mutex mutex;
    std::optional<CancellationReason> reason;
    std::optional<std::chrono::steady_clock::time_point> cancelledAt;
    bool completed = false;
    std::map<CallbackId, std::function<void(CancellationReason)>> callbacks;
    CallbackId nextCallbackId = 1;
};

CancellationToken::CancellationToken(): _state(std::make_shared<State>())
{
}

auto CancellationToken::cancel(CancellationReason reason) -> bool
{
    auto lock = std::lock_guard(_state->mutex);
    if (_state->reason || _state->completed)
        return false;

    _state->reason = reason;
    _state->cancelledAt = std::chrono::steady_clock::now();

    // Callbacks run under the lock so that removeCallback() cannot return while one is executing.
    auto callbacks = std::move(_state->callbacks);
    _state->callbacks.clear();
    for (auto& [id, callback]: callbacks)
        callback(reason);

    return true;
}

auto CancellationToken::complete() -> bool
{
    auto lock = std::lock_guard(_state->mutex);
    if (_state->reason || _state->completed)
        return false;

    _state->completed = true;
    _state->callbacks.clear();
    return true;
}

auto CancellationToken::isCompleted() const -> bool
{
    auto lock = std::lock_guard(_state->mutex);
    return _state->completed;
}

auto CancellationToken::isCancelled() const -> bool
{
    auto lock = std::lock_guard(_state->mutex);
    return _state->reason.has_value();
}

auto CancellationToken::reason() const -> std::optional<CancellationReason>
{
    auto lock = std::lock_guard(_state->mutex);
    return _state->reason;
}

auto CancellationToken::cancelledAt() const -> std::optional<std::chrono::steady_clock::time_point>
{
    auto lock = std::lock_guard(_state->mutex);
    return _state->cancelledAt;
}

auto CancellationToken::checkCancelled() const -> VoidResult
{
    auto const currentReason = reason();
    if (!currentReason)
        return {};

    auto error = Error {
        .code = ErrorCode::CancelledError,
        .message = std::format("Request cancelled: {}", describe(*currentReason)),
    };
    error.data = nlohmann::json { { "reason", std::string(describe(*currentReason)) } };
    return std::unexpected(std::move(error));
}

auto CancellationToken::onCancel(std::function<void(CancellationReason)> callback) -> CallbackId
{
    auto firedReason = std::optional<CancellationReason> {};
    auto id = CallbackId {};
    {
        auto lock = std::lock_guard(_state->mutex);
        id = _state->nextCallbackId++;
        if (_state->reason)
            firedReason = _state->reason;
        else if (!_state->completed)
            _state->callbacks.emplace(id, std::move(callback));
    }

    if (firedReason)
        callback(*firedReason);

    return id;
}

void CancellationToken::removeCallback(CallbackId id)
{
    auto lock = std::lock_guard(_state->mutex);
    _state->callbacks.erase(id);
}

} // namespace mcprt
