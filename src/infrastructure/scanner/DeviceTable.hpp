/**
 * @file DeviceTable.hpp
 * @brief Thread-safe inventory of discovered devices.
 */

#pragma once

#include "core/types/NetworkDevice.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanscout::infra {

/**
 * @brief What one successful probe learned about an address.
 */
struct DeviceObservation {
    std::chrono::microseconds responseTime{0};
    std::optional<std::string> name;       ///< Resolved hostname, if any
    std::optional<std::string> type;       ///< Classification label, if any
    std::optional<std::string> macAddress; ///< Hardware address, if any
};

/**
 * @brief Result of an upsert. @c changed is set when the device is new, or
 *        its online state or type differs from before.
 */
struct DeviceChange {
    core::NetworkDevice device;
    bool created{false};
    bool changed{false};
};

/**
 * @brief The single shared map from address to NetworkDevice.
 *
 * Every method locks internally and returns copies, so callers never hold
 * references into the table. Entries keep insertion order.
 */
class DeviceTable {
public:
    /**
     * @brief Creates or updates the entry for an address that answered a ping.
     *
     * A missing name keeps the previous one (or the placeholder for new
     * entries); a missing type keeps the previous classification.
     */
    DeviceChange recordOnline(const std::string& address, const DeviceObservation& observation);

    /**
     * @brief Marks a known device offline.
     * @return The updated device if it was online before, nullopt otherwise.
     */
    std::optional<core::NetworkDevice> markOffline(const std::string& address);

    /**
     * @brief Marks every online device whose address is not in @p seenOnline offline.
     * @return The devices that changed state.
     */
    std::vector<core::NetworkDevice> markOfflineExcept(const std::set<std::string>& seenOnline);

    /**
     * @brief Creates an offline entry if the address is unknown.
     */
    DeviceChange ensure(const std::string& address, const std::optional<std::string>& name);

    /**
     * @brief Loads persisted devices. Restored devices start offline; invalid
     *        and duplicate addresses are skipped.
     * @return Number of devices restored.
     */
    size_t restore(const std::vector<core::NetworkDevice>& devices);

    bool remove(const std::string& address);

    [[nodiscard]] std::optional<core::NetworkDevice> find(const std::string& address) const;
    [[nodiscard]] std::vector<core::NetworkDevice> snapshot() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t onlineCount() const;

private:
    core::NetworkDevice* findLocked(const std::string& address);
    core::NetworkDevice& insertLocked(core::NetworkDevice device);
    void reindexLocked();

    mutable std::mutex mutex_;
    std::vector<core::NetworkDevice> devices_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace lanscout::infra
