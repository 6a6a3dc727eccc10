#include "infrastructure/scanner/ScanEventHub.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lanscout::infra {

ScanEventHub::ScanEventHub()
    : dispatcher_([this](std::stop_token stopToken) { dispatchLoop(stopToken); }) {}

ScanEventHub::~ScanEventHub() {
    dispatcher_.request_stop();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

int64_t ScanEventHub::subscribe(core::ScanEventType type, EventCallback callback) {
    std::lock_guard lock(subscriptionsMutex_);
    int64_t id = nextSubscriptionId_++;
    subscriptions_.push_back({id, type, std::move(callback)});
    spdlog::debug("Subscribed to {} (id={})", core::toString(type), id);
    return id;
}

void ScanEventHub::unsubscribe(int64_t subscriptionId) {
    std::lock_guard lock(subscriptionsMutex_);
    subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                                        [subscriptionId](const Subscription& sub) {
                                            return sub.id == subscriptionId;
                                        }),
                         subscriptions_.end());
    spdlog::debug("Unsubscribed (id={})", subscriptionId);
}

size_t ScanEventHub::subscriberCount() const {
    std::lock_guard lock(subscriptionsMutex_);
    return subscriptions_.size();
}

void ScanEventHub::publish(core::ScanEvent event) {
    {
        std::lock_guard lock(queueMutex_);
        queue_.push_back(std::move(event));
    }
    queueChanged_.notify_all();
}

void ScanEventHub::flush() {
    std::unique_lock lock(queueMutex_);
    queueChanged_.wait(lock, [this] { return queue_.empty() && !dispatching_; });
}

void ScanEventHub::dispatchLoop(std::stop_token stopToken) {
    while (true) {
        core::ScanEvent event;
        {
            std::unique_lock lock(queueMutex_);
            queueChanged_.wait(lock, stopToken, [this] { return !queue_.empty(); });
            if (queue_.empty()) {
                break; // Stop requested and nothing left to deliver
            }
            event = std::move(queue_.front());
            queue_.pop_front();
            dispatching_ = true;
        }

        deliver(event);

        {
            std::lock_guard lock(queueMutex_);
            dispatching_ = false;
        }
        queueChanged_.notify_all();
    }
}

void ScanEventHub::deliver(const core::ScanEvent& event) {
    std::vector<EventCallback> callbacks;

    {
        std::lock_guard lock(subscriptionsMutex_);
        for (const auto& sub : subscriptions_) {
            if (sub.type == event.type) {
                callbacks.push_back(sub.callback);
            }
        }
    }

    for (const auto& callback : callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            spdlog::error("Error in {} handler: {}", core::toString(event.type), e.what());
        }
    }
}

} // namespace lanscout::infra
