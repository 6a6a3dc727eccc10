#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace lanscout::infra {

/**
 * @brief Address-to-label store fed by a passive detector's listener.
 *
 * Written from I/O threads as announcements arrive, read from sweep workers.
 * Entries expire @c ttl after their last refresh. Each detector owns its own
 * cache, so the lock is never held together with the device table lock.
 */
class PassiveDiscoveryCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit PassiveDiscoveryCache(Clock::duration ttl);

    /**
     * @brief Returns the label for @p address if present and not expired.
     */
    std::optional<std::string> find(const std::string& address);

    /**
     * @brief Inserts or refreshes an entry and wakes waiters.
     * @param preferLonger Keep an existing longer label instead of replacing it.
     */
    void store(const std::string& address, const std::string& label, bool preferLonger = false);

    /**
     * @brief Waits until @p address appears, @p timeout elapses or stop is requested.
     */
    std::optional<std::string> waitFor(const std::string& address, Clock::duration timeout,
                                       std::stop_token stopToken);

    [[nodiscard]] size_t size() const;
    void clear();

private:
    struct Entry {
        std::string label;
        Clock::time_point refreshedAt;
    };

    std::optional<std::string> findLocked(const std::string& address);

    Clock::duration ttl_;
    mutable std::mutex mutex_;
    std::condition_variable_any changed_;
    std::map<std::string, Entry> entries_;
};

} // namespace lanscout::infra
