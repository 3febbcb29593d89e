#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "events/events.h"

namespace nodeward {

/**
 * Handle returned by Channel::subscribe. Unsubscribes when reset or destroyed.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
        other.cancel_ = nullptr;
    }
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }
    Subscription(const Subscription&)            = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

private:
    std::function<void()> cancel_;
};

/**
 * Typed publish/subscribe channel for one event kind.
 *
 * Deliveries on every channel sharing `dispatch_mutex` are serialized, so
 * observers see events in publish order. Handlers run on the publishing
 * thread and must not block. Unsubscribing blocks until no delivery is in
 * progress, after which the handler is never called again.
 */
template <typename Event>
class Channel {
public:
    using Handler = std::function<void(const Event&)>;

    explicit Channel(std::shared_ptr<std::recursive_mutex> dispatch_mutex)
        : dispatch_mutex_(std::move(dispatch_mutex)),
          state_(std::make_shared<State>()) {}

    [[nodiscard]] Subscription subscribe(Handler handler) {
        uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            id = ++state_->next_id;
            state_->handlers.emplace_back(id, std::move(handler));
        }
        std::weak_ptr<State> weak = state_;
        std::weak_ptr<std::recursive_mutex> weak_dispatch = dispatch_mutex_;
        return Subscription([weak, weak_dispatch, id] {
            auto dispatch = weak_dispatch.lock();
            auto state    = weak.lock();
            if (dispatch && state) {
                // Waits out a delivery in progress on another thread.
                std::lock_guard<std::recursive_mutex> delivering(*dispatch);
                std::lock_guard<std::mutex> lock(state->mutex);
                auto& hs = state->handlers;
                hs.erase(std::remove_if(hs.begin(), hs.end(),
                                        [id](const auto& h) { return h.first == id; }),
                         hs.end());
            }
        });
    }

    void publish(const Event& event) const {
        std::lock_guard<std::recursive_mutex> dispatch(*dispatch_mutex_);
        std::vector<std::pair<uint64_t, Handler>> handlers;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            handlers = state_->handlers;
        }
        for (const auto& h : handlers) {
            h.second(event);
        }
    }

    [[nodiscard]] std::size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->handlers.size();
    }

private:
    struct State {
        std::mutex                                mutex;
        uint64_t                                  next_id = 0;
        std::vector<std::pair<uint64_t, Handler>> handlers;
    };

    std::shared_ptr<std::recursive_mutex> dispatch_mutex_;
    std::shared_ptr<State>                state_;
};

/**
 * The supervisor's outbound channels.
 */
class EventBus {
public:
    EventBus()
        : dispatch_mutex_(std::make_shared<std::recursive_mutex>()),
          status_changed(dispatch_mutex_),
          download_progress(dispatch_mutex_),
          download_complete(dispatch_mutex_),
          download_failed(dispatch_mutex_) {}

private:
    std::shared_ptr<std::recursive_mutex> dispatch_mutex_;

public:
    Channel<StatusChanged>    status_changed;
    Channel<DownloadProgress> download_progress;
    Channel<DownloadComplete> download_complete;
    Channel<DownloadFailed>   download_failed;
};

}  // namespace nodeward
