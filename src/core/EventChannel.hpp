// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace mcprt
{

/// @brief Fan-out publish/subscribe channel with a bounded buffer per subscriber.
///
/// Publishing never blocks: when a subscriber's buffer is full, its oldest event is
/// discarded and counted as dropped. Subscribers that have been destroyed are pruned
/// on the next publish.
/// @tparam T The event type. Must be copyable.
template <typename T>
class EventChannel
{
    struct Queue
    {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<T> events;
        std::size_t capacity = 0;
        std::size_t dropped = 0;
        bool closed = false;
    };

  public:
    /// @brief Receiving end of a subscription.
    ///
    /// Only sees events published after it was created.
    class Receiver
    {
      public:
        Receiver() = default;

        /// @brief Returns the next buffered event without waiting.
        [[nodiscard]] auto tryReceive() -> std::optional<T>
        {
            if (!_queue)
                return std::nullopt;
            auto lock = std::lock_guard(_queue->mutex);
            return popLocked();
        }

        /// @brief Waits up to @p timeout for the next event.
        /// @return The event, or std::nullopt on timeout or when the channel was closed.
        template <typename Rep, typename Period>
        [[nodiscard]] auto receive(std::chrono::duration<Rep, Period> timeout) -> std::optional<T>
        {
            if (!_queue)
                return std::nullopt;
            auto lock = std::unique_lock(_queue->mutex);
            _queue->cv.wait_for(lock, timeout, [this] { return !_queue->events.empty() || _queue->closed; });
            return popLocked();
        }

        /// @brief Returns and removes all buffered events.
        [[nodiscard]] auto drain() -> std::vector<T>
        {
            auto result = std::vector<T> {};
            if (!_queue)
                return result;
            auto lock = std::lock_guard(_queue->mutex);
            result.assign(std::make_move_iterator(_queue->events.begin()),
                          std::make_move_iterator(_queue->events.end()));
            _queue->events.clear();
            return result;
        }

        /// @brief Returns the number of events discarded because this receiver fell behind.
        [[nodiscard]] auto dropped() const -> std::size_t
        {
            if (!_queue)
                return 0;
            auto lock = std::lock_guard(_queue->mutex);
            return _queue->dropped;
        }

        /// @brief Returns true if the receiver is attached to a channel.
        [[nodiscard]] auto valid() const noexcept -> bool { return _queue != nullptr; }

      private:
        friend class EventChannel;

        explicit Receiver(std::shared_ptr<Queue> queue): _queue(std::move(queue)) {}

        auto popLocked() -> std::optional<T>
        {
            if (_queue->events.empty())
                return std::nullopt;
            auto event = std::move(_queue->events.front());
            _queue->events.pop_front();
            return event;
        }

        std::shared_ptr<Queue> _queue;
    };

    /// @brief Constructs a channel.
    /// @param capacity Maximum number of buffered events per subscriber.
    explicit EventChannel(std::size_t capacity = 256): _capacity(capacity == 0 ? 1 : capacity) {}

    ~EventChannel() { close(); }

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /// @brief Creates a new subscription.
    [[nodiscard]] auto subscribe() -> Receiver
    {
        auto queue = std::make_shared<Queue>();
        queue->capacity = _capacity;

        auto lock = std::lock_guard(_mutex);
        _subscribers.push_back(queue);
        return Receiver(std::move(queue));
    }

    /// @brief Delivers an event to every live subscriber.
    void publish(const T& event)
    {
        auto targets = std::vector<std::shared_ptr<Queue>> {};
        {
            auto lock = std::lock_guard(_mutex);
            std::erase_if(_subscribers, [](const std::weak_ptr<Queue>& weak) { return weak.expired(); });
            for (const auto& weak: _subscribers)
            {
                if (auto queue = weak.lock())
                    targets.push_back(std::move(queue));
            }
        }

        for (const auto& queue: targets)
        {
            {
                auto lock = std::lock_guard(queue->mutex);
                if (queue->closed)
                    continue;
                if (queue->events.size() >= queue->capacity)
                {
                    queue->events.pop_front();
                    ++queue->dropped;
                }
                queue->events.push_back(event);
            }
            queue->cv.notify_all();
        }
    }

    /// @brief Returns the number of live subscribers.
    [[nodiscard]] auto subscriberCount() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return static_cast<std::size_t>(
            std::ranges::count_if(_subscribers, [](const std::weak_ptr<Queue>& weak) { return !weak.expired(); }));
    }

    /// @brief Wakes up all waiting receivers; later publishes are discarded for existing subscribers.
    void close()
    {
        auto lock = std::lock_guard(_mutex);
        for (const auto& weak: _subscribers)
        {
            if (auto queue = weak.lock())
            {
                {
                    auto queueLock = std::lock_guard(queue->mutex);
                    queue->closed = true;
                }
                queue->cv.notify_all();
            }
        }
    }

  private:
    std::size_t _capacity;
    mutable std::mutex _mutex;
    std::vector<std::weak_ptr<Queue>> _subscribers;
};

} // namespace mcprt
