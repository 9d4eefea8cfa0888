#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "error.hpp"
#include "log.hpp"

namespace eematrix::store {

/// What happens to a subscriber whose queue is full when a new item is sent.
enum class LagPolicy {
    /// The subscriber's pending items are discarded; its next read throws `stream_lagged` and the
    /// subscription ends.
    error,
    /// The new item is dropped for that subscriber only and a warning is logged.
    drop,
};

template <typename T>
class Subscription;

/// Multi-consumer channel: every subscriber independently receives every item sent after it
/// subscribed, in send order, through its own bounded queue.
///
/// Destroying the Broadcast ends all subscriptions once they have drained their queues.
template <typename T>
class Broadcast {
  public:
    Broadcast(std::string name, size_t capacity, LagPolicy policy) :
            shared_{std::make_shared<Shared>()},
            name_{std::move(name)},
            capacity_{capacity == 0 ? 1 : capacity},
            policy_{policy} {}

    ~Broadcast() {
        {
            std::lock_guard lock{shared_->mutex};
            shared_->closed = true;
        }
        shared_->cv.notify_all();
    }

    Broadcast(Broadcast&&) = delete;
    Broadcast(const Broadcast&) = delete;
    Broadcast& operator=(Broadcast&&) = delete;
    Broadcast& operator=(const Broadcast&) = delete;

    // If set then we log things by calling this callback
    logger_callable logger;

    Subscription<T> subscribe() {
        auto queue = std::make_shared<Queue>();
        std::lock_guard lock{shared_->mutex};
        shared_->subscribers.push_back(queue);
        return Subscription<T>{shared_, std::move(queue)};
    }

    /// Sends `item` to every live subscriber.  Never blocks on slow subscribers.
    void send(const T& item) {
        size_t dropped = 0;
        {
            std::lock_guard lock{shared_->mutex};
            auto& subs = shared_->subscribers;
            for (auto it = subs.begin(); it != subs.end();) {
                auto queue = it->lock();
                if (!queue || queue->finished) {
                    it = subs.erase(it);
                    continue;
                }
                if (queue->items.size() >= capacity_) {
                    if (policy_ == LagPolicy::error) {
                        queue->skipped += queue->items.size() + 1;
                        queue->items.clear();
                    } else {
                        dropped++;
                    }
                } else if (queue->skipped == 0) {
                    queue->items.push_back(item);
                }
                ++it;
            }
        }
        shared_->cv.notify_all();

        if (dropped > 0 && logger)
            logger(LogLevel::warning,
                   name_ + ": " + std::to_string(dropped) +
                           " subscriber(s) lagging behind, dropped an update");
    }

    size_t subscriber_count() const {
        std::lock_guard lock{shared_->mutex};
        size_t count = 0;
        for (auto& weak : shared_->subscribers)
            if (auto q = weak.lock(); q && !q->finished)
                count++;
        return count;
    }

  private:
    friend class Subscription<T>;

    struct Queue {
        std::deque<T> items;
        size_t skipped = 0;
        bool finished = false;
    };

    struct Shared {
        mutable std::mutex mutex;
        std::condition_variable cv;
        bool closed = false;
        std::vector<std::weak_ptr<Queue>> subscribers;
    };

    std::shared_ptr<Shared> shared_;
    std::string name_;
    size_t capacity_;
    LagPolicy policy_;
};

/// The receiving end of a Broadcast.  Move-only; dropping it unsubscribes.
template <typename T>
class Subscription {
  public:
    Subscription(Subscription&&) = default;
    Subscription& operator=(Subscription&&) = default;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    /// Waits up to `timeout` for the next item.  Returns nullopt on timeout or once the stream has
    /// ended (see `ended()`).  Throws `stream_lagged` if items were discarded because this
    /// subscriber fell behind on an error-policy channel; the subscription is over after that.
    std::optional<T> next(std::chrono::milliseconds timeout) {
        std::unique_lock lock{shared_->mutex};
        shared_->cv.wait_for(lock, timeout, [this] {
            return !queue_->items.empty() || queue_->skipped > 0 || queue_->finished ||
                   shared_->closed;
        });
        return pop_locked();
    }

    /// Returns the next item if one is already queued, without waiting.
    std::optional<T> try_next() {
        std::lock_guard lock{shared_->mutex};
        return pop_locked();
    }

    /// True once nothing more will ever be delivered.
    bool ended() const {
        std::lock_guard lock{shared_->mutex};
        return queue_->finished || (shared_->closed && queue_->items.empty());
    }

  private:
    friend class Broadcast<T>;

    using Shared = typename Broadcast<T>::Shared;
    using Queue = typename Broadcast<T>::Queue;

    Subscription(std::shared_ptr<Shared> shared, std::shared_ptr<Queue> queue) :
            shared_{std::move(shared)}, queue_{std::move(queue)} {}

    std::optional<T> pop_locked() {
        if (queue_->skipped > 0) {
            auto skipped = queue_->skipped;
            queue_->skipped = 0;
            queue_->finished = true;
            throw stream_lagged{skipped};
        }
        if (queue_->items.empty())
            return std::nullopt;
        std::optional<T> item{std::move(queue_->items.front())};
        queue_->items.pop_front();
        return item;
    }

    std::shared_ptr<Shared> shared_;
    std::shared_ptr<Queue> queue_;
};

/// A subscription whose items are transformed on the way out.
template <typename T, typename U>
class MappedSubscription {
  public:
    MappedSubscription(Subscription<T> inner, std::function<U(T)> map) :
            inner_{std::move(inner)}, map_{std::move(map)} {}

    std::optional<U> next(std::chrono::milliseconds timeout) {
        auto item = inner_.next(timeout);
        if (!item)
            return std::nullopt;
        return map_(std::move(*item));
    }

    std::optional<U> try_next() {
        auto item = inner_.try_next();
        if (!item)
            return std::nullopt;
        return map_(std::move(*item));
    }

    bool ended() const { return inner_.ended(); }

  private:
    Subscription<T> inner_;
    std::function<U(T)> map_;
};

}  // namespace eematrix::store
