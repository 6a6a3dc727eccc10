#include "infrastructure/scanner/DeviceTable.hpp"

#include "infrastructure/network/IpRange.hpp"

#include <algorithm>

namespace lanscout::infra {

core::NetworkDevice* DeviceTable::findLocked(const std::string& address) {
    auto it = index_.find(address);
    return it == index_.end() ? nullptr : &devices_[it->second];
}

core::NetworkDevice& DeviceTable::insertLocked(core::NetworkDevice device) {
    index_[device.address] = devices_.size();
    devices_.push_back(std::move(device));
    return devices_.back();
}

void DeviceTable::reindexLocked() {
    index_.clear();
    for (size_t i = 0; i < devices_.size(); ++i) {
        index_[devices_[i].address] = i;
    }
}

DeviceChange DeviceTable::recordOnline(const std::string& address,
                                       const DeviceObservation& observation) {
    std::lock_guard lock(mutex_);
    DeviceChange change;

    auto* device = findLocked(address);
    if (device == nullptr) {
        core::NetworkDevice fresh;
        fresh.address = address;
        fresh.name = core::NetworkDevice::placeholderName(address);
        device = &insertLocked(std::move(fresh));
        change.created = true;
    }

    bool wasOnline = device->isOnline;
    std::string previousType = device->type;

    device->isOnline = true;
    device->lastSeen = std::chrono::system_clock::now();
    device->responseTime = observation.responseTime;

    if (observation.name && !observation.name->empty()) {
        device->name = *observation.name;
    }
    if (observation.type && !observation.type->empty()) {
        device->type = *observation.type;
    }
    if (observation.macAddress) {
        device->macAddress = observation.macAddress;
    }

    change.changed = change.created || !wasOnline || device->type != previousType;
    change.device = *device;
    return change;
}

std::optional<core::NetworkDevice> DeviceTable::markOffline(const std::string& address) {
    std::lock_guard lock(mutex_);
    auto* device = findLocked(address);
    if (device == nullptr || !device->isOnline) {
        return std::nullopt;
    }

    device->isOnline = false;
    device->responseTime = std::chrono::microseconds(0);
    return *device;
}

std::vector<core::NetworkDevice> DeviceTable::markOfflineExcept(
    const std::set<std::string>& seenOnline) {
    std::lock_guard lock(mutex_);
    std::vector<core::NetworkDevice> changed;

    for (auto& device : devices_) {
        if (device.isOnline && !seenOnline.contains(device.address)) {
            device.isOnline = false;
            device.responseTime = std::chrono::microseconds(0);
            changed.push_back(device);
        }
    }
    return changed;
}

DeviceChange DeviceTable::ensure(const std::string& address,
                                 const std::optional<std::string>& name) {
    std::lock_guard lock(mutex_);
    DeviceChange change;

    if (auto* device = findLocked(address)) {
        change.device = *device;
        return change;
    }

    core::NetworkDevice fresh;
    fresh.address = address;
    fresh.name = name && !name->empty() ? *name : core::NetworkDevice::placeholderName(address);
    change.device = insertLocked(std::move(fresh));
    change.created = true;
    change.changed = true;
    return change;
}

size_t DeviceTable::restore(const std::vector<core::NetworkDevice>& devices) {
    std::lock_guard lock(mutex_);
    size_t restored = 0;

    for (auto device : devices) {
        if (!IpRangeEnumerator::isValidIpv4(device.address) || findLocked(device.address)) {
            continue;
        }
        device.isOnline = false;
        device.responseTime = std::chrono::microseconds(0);
        if (device.name.empty()) {
            device.name = core::NetworkDevice::placeholderName(device.address);
        }
        insertLocked(std::move(device));
        ++restored;
    }
    return restored;
}

bool DeviceTable::remove(const std::string& address) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(devices_.begin(), devices_.end(),
                           [&address](const core::NetworkDevice& d) { return d.address == address; });
    if (it == devices_.end()) {
        return false;
    }
    devices_.erase(it);
    reindexLocked();
    return true;
}

std::optional<core::NetworkDevice> DeviceTable::find(const std::string& address) const {
    std::lock_guard lock(mutex_);
    auto it = index_.find(address);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return devices_[it->second];
}

std::vector<core::NetworkDevice> DeviceTable::snapshot() const {
    std::lock_guard lock(mutex_);
    return devices_;
}

size_t DeviceTable::size() const {
    std::lock_guard lock(mutex_);
    return devices_.size();
}

size_t DeviceTable::onlineCount() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(devices_.begin(), devices_.end(),
                                             [](const core::NetworkDevice& d) { return d.isOnline; }));
}

} // namespace lanscout::infra
