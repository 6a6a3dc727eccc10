#pragma once

#include "core/types/ScanEvent.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace lanscout::infra {

/**
 * @brief Delivers scanner events to subscribers on a dedicated thread.
 *
 * publish() only enqueues, so sweep workers never wait on handlers. Handlers
 * run one at a time in publish order; an exception from one handler is logged
 * and does not affect the others. Pending events are delivered before the hub
 * is destroyed.
 */
class ScanEventHub {
public:
    using EventCallback = std::function<void(const core::ScanEvent&)>;

    ScanEventHub();
    ~ScanEventHub();

    ScanEventHub(const ScanEventHub&) = delete;
    ScanEventHub& operator=(const ScanEventHub&) = delete;

    int64_t subscribe(core::ScanEventType type, EventCallback callback);
    void unsubscribe(int64_t subscriptionId);

    /**
     * @brief Queues an event for delivery.
     */
    void publish(core::ScanEvent event);

    /**
     * @brief Blocks until every event queued so far has been delivered.
     * @note Must not be called from an event handler.
     */
    void flush();

    [[nodiscard]] size_t subscriberCount() const;

private:
    struct Subscription {
        int64_t id;
        core::ScanEventType type;
        EventCallback callback;
    };

    void dispatchLoop(std::stop_token stopToken);
    void deliver(const core::ScanEvent& event);

    mutable std::mutex subscriptionsMutex_;
    std::vector<Subscription> subscriptions_;
    int64_t nextSubscriptionId_{1};

    std::mutex queueMutex_;
    std::condition_variable_any queueChanged_;
    std::deque<core::ScanEvent> queue_;
    bool dispatching_{false};

    std::jthread dispatcher_;
};

} // namespace lanscout::infra
