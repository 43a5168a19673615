// SPDX-License-Identifier: Apache-2.0
#include "CancellationManager.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <shared_mutex>
#include <unordered_map>

namespace mcprt
{

namespace
{

    auto elapsedSince(std::chrono::steady_clock::time_point start) -> std::chrono::milliseconds
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    }

} // namespace

struct CancellationManager::Impl
{
    struct Entry
    {
        CancellableRequest request;
        CancellationToken token;
    };

    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, Entry> entries;
    EventChannel<CancellationEvent> events { 256 };

    template <typename Predicate>
    auto collectIds(Predicate&& predicate) const -> std::vector<std::string>
    {
        auto lock = std::shared_lock(mutex);
        auto ids = std::vector<std::string> {};
        for (const auto& [id, entry]: entries)
        {
            if (predicate(entry.request))
                ids.push_back(id);
        }
        return ids;
    }

    template <typename Predicate>
    auto collectRequests(Predicate&& predicate) const -> std::vector<CancellableRequest>
    {
        auto lock = std::shared_lock(mutex);
        auto requests = std::vector<CancellableRequest> {};
        for (const auto& [id, entry]: entries)
        {
            if (predicate(entry.request))
                requests.push_back(entry.request);
        }
        std::ranges::sort(requests, {}, &CancellableRequest::startTime);
        return requests;
    }

    void publishUnregistered(const CancellableRequest& request)
    {
        events.publish(CancellationEvent {
            .kind = CancellationEvent::Kind::RequestUnregistered,
            .requestId = request.id,
            .serverName = request.serverName,
            .method = request.method,
        });
    }
};

CancellationManager::CancellationManager(): _impl(std::make_unique<Impl>())
{
}

CancellationManager::~CancellationManager() = default;

auto CancellationManager::subscribe() -> EventChannel<CancellationEvent>::Receiver
{
    return _impl->events.subscribe();
}

auto CancellationManager::registerRequest(std::string id,
                                          std::string serverName,
                                          std::string method,
                                          std::optional<std::chrono::milliseconds> timeout)
    -> Result<CancellationToken>
{
    auto token = CancellationToken {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        if (_impl->entries.contains(id))
            return makeError(ErrorCode::ValidationError, std::format("Request id '{}' is already in flight", id));

        _impl->entries.emplace(id,
                               Impl::Entry {
                                   .request =
                                       CancellableRequest {
                                           .id = id,
                                           .serverName = serverName,
                                           .method = method,
                                           .startTime = std::chrono::steady_clock::now(),
                                           .timeout = timeout,
                                       },
                                   .token = token,
                               });
    }

    _impl->events.publish(CancellationEvent {
        .kind = CancellationEvent::Kind::RequestRegistered,
        .requestId = std::move(id),
        .serverName = std::move(serverName),
        .method = std::move(method),
    });

    return token;
}

auto CancellationManager::unregisterRequest(std::string_view id) -> bool
{
    auto entry = std::optional<Impl::Entry> {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        auto const it = _impl->entries.find(std::string(id));
        if (it == _impl->entries.end())
            return false;
        entry = std::move(it->second);
        _impl->entries.erase(it);
    }

    entry->token.complete();
    _impl->publishUnregistered(entry->request);
    return true;
}

auto CancellationManager::completeRequest(std::string_view id, CancellationToken& token) -> bool
{
    // The token decides the race against cancelRequest(); the entry is only bookkeeping.
    auto const completed = token.complete();

    auto request = std::optional<CancellableRequest> {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        auto const it = _impl->entries.find(std::string(id));
        if (it != _impl->entries.end() && it->second.token == token)
        {
            request = std::move(it->second.request);
            _impl->entries.erase(it);
        }
    }

    if (request)
        _impl->publishUnregistered(*request);
    return completed;
}

auto CancellationManager::hasRequest(std::string_view id) const -> bool
{
    auto lock = std::shared_lock(_impl->mutex);
    return _impl->entries.contains(std::string(id));
}

auto CancellationManager::getRequest(std::string_view id) const -> std::optional<CancellableRequest>
{
    auto lock = std::shared_lock(_impl->mutex);
    auto const it = _impl->entries.find(std::string(id));
    if (it == _impl->entries.end())
        return std::nullopt;
    return it->second.request;
}

auto CancellationManager::getAllRequests() const -> std::vector<CancellableRequest>
{
    return _impl->collectRequests([](const CancellableRequest&) { return true; });
}

auto CancellationManager::getServerRequests(std::string_view serverName) const -> std::vector<CancellableRequest>
{
    return _impl->collectRequests(
        [serverName](const CancellableRequest& request) { return request.serverName == serverName; });
}

auto CancellationManager::cancelRequest(std::string_view id, CancellationReason reason)
    -> std::optional<CancellationResult>
{
    auto entry = std::optional<Impl::Entry> {};
    {
        auto lock = std::unique_lock(_impl->mutex);
        auto const it = _impl->entries.find(std::string(id));
        if (it == _impl->entries.end())
            return std::nullopt;
        entry = std::move(it->second);
        _impl->entries.erase(it);
    }

    // The token is cancelled outside the lock; its callbacks may resolve transport slots.
    if (!entry->token.cancel(reason))
    {
        log::debug("Request {} on '{}' completed before it could be cancelled",
                   entry->request.id,
                   entry->request.serverName);
        return std::nullopt;
    }

    auto result = CancellationResult {
        .success = true,
        .reason = reason,
        .requestId = entry->request.id,
        .serverName = entry->request.serverName,
        .duration = elapsedSince(entry->request.startTime),
    };

    log::debug("Cancelled request {} on '{}': {}", result.requestId, result.serverName, describe(reason));

    _impl->events.publish(CancellationEvent {
        .kind = CancellationEvent::Kind::RequestCancelled,
        .requestId = result.requestId,
        .serverName = result.serverName,
        .method = entry->request.method,
        .result = result,
    });

    return result;
}

auto CancellationManager::cancelServerRequests(std::string_view serverName, CancellationReason reason)
    -> std::vector<CancellationResult>
{
    auto const ids =
        _impl->collectIds([serverName](const CancellableRequest& request) { return request.serverName == serverName; });

    auto results = std::vector<CancellationResult> {};
    for (const auto& id: ids)
    {
        if (auto result = cancelRequest(id, reason))
            results.push_back(std::move(*result));
    }

    _impl->events.publish(CancellationEvent {
        .kind = CancellationEvent::Kind::ServerCancelled,
        .serverName = std::string(serverName),
        .count = results.size(),
    });

    return results;
}

auto CancellationManager::cancelAll(CancellationReason reason) -> std::vector<CancellationResult>
{
    auto const ids = _impl->collectIds([](const CancellableRequest&) { return true; });

    auto results = std::vector<CancellationResult> {};
    for (const auto& id: ids)
    {
        if (auto result = cancelRequest(id, reason))
            results.push_back(std::move(*result));
    }

    _impl->events.publish(CancellationEvent {
        .kind = CancellationEvent::Kind::AllCancelled,
        .count = results.size(),
    });

    return results;
}

auto CancellationManager::cancelExpiredRequests() -> std::vector<CancellationResult>
{
    auto const now = std::chrono::steady_clock::now();
    auto const ids = _impl->collectIds([now](const CancellableRequest& request) {
        return request.timeout && now - request.startTime >= *request.timeout;
    });

    auto results = std::vector<CancellationResult> {};
    for (const auto& id: ids)
    {
        if (auto result = cancelRequest(id, CancellationReason::Timeout))
            results.push_back(std::move(*result));
    }
    return results;
}

auto CancellationManager::stats() const -> CancellationStats
{
    auto lock = std::shared_lock(_impl->mutex);
    auto stats = CancellationStats { .activeRequests = _impl->entries.size() };
    for (const auto& [id, entry]: _impl->entries)
    {
        ++stats.byServer[entry.request.serverName];
        if (entry.request.timeout)
            ++stats.withTimeout;
    }
    return stats;
}

auto CancellationManager::requestDurations() const -> std::vector<RequestDuration>
{
    auto durations = std::vector<RequestDuration> {};
    for (const auto& request: getAllRequests())
    {
        durations.push_back(RequestDuration {
            .id = request.id,
            .serverName = request.serverName,
            .method = request.method,
            .duration = elapsedSince(request.startTime),
        });
    }
    return durations;
}

auto CancellationManager::findLongRunningRequests(std::chrono::milliseconds threshold) const
    -> std::vector<CancellableRequest>
{
    auto const now = std::chrono::steady_clock::now();
    return _impl->collectRequests(
        [now, threshold](const CancellableRequest& request) { return now - request.startTime > threshold; });
}

void CancellationManager::cleanup()
{
    auto lock = std::unique_lock(_impl->mutex);
    _impl->entries.clear();
}

} // namespace mcprt
