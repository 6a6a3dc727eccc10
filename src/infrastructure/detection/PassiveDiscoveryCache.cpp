#include "infrastructure/detection/PassiveDiscoveryCache.hpp"

namespace lanscout::infra {

PassiveDiscoveryCache::PassiveDiscoveryCache(Clock::duration ttl) : ttl_(ttl) {}

std::optional<std::string> PassiveDiscoveryCache::findLocked(const std::string& address) {
    auto it = entries_.find(address);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (Clock::now() - it->second.refreshedAt > ttl_) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.label;
}

std::optional<std::string> PassiveDiscoveryCache::find(const std::string& address) {
    std::lock_guard lock(mutex_);
    return findLocked(address);
}

void PassiveDiscoveryCache::store(const std::string& address, const std::string& label,
                                  bool preferLonger) {
    {
        std::lock_guard lock(mutex_);
        auto now = Clock::now();
        auto existing = findLocked(address);

        if (preferLonger && existing && existing->size() >= label.size()) {
            entries_[address].refreshedAt = now;
        } else {
            entries_[address] = Entry{label, now};
        }
    }
    changed_.notify_all();
}

std::optional<std::string> PassiveDiscoveryCache::waitFor(const std::string& address,
                                                          Clock::duration timeout,
                                                          std::stop_token stopToken) {
    std::unique_lock lock(mutex_);
    changed_.wait_for(lock, stopToken, timeout,
                      [this, &address] { return findLocked(address).has_value(); });
    return findLocked(address);
}

size_t PassiveDiscoveryCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void PassiveDiscoveryCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

} // namespace lanscout::infra
