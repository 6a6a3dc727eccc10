#include "infrastructure/storage/JsonDeviceStorage.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace lanscout::infra {

JsonDeviceStorage::JsonDeviceStorage(const std::filesystem::path& dataDir)
    : filePath_(dataDir / "known_devices.json") {
    if (!std::filesystem::exists(dataDir)) {
        std::filesystem::create_directories(dataDir);
    }
}

std::vector<core::NetworkDevice> JsonDeviceStorage::loadDevices() {
    std::lock_guard lock(mutex_);
    std::vector<core::NetworkDevice> devices;

    if (!std::filesystem::exists(filePath_)) {
        spdlog::debug("No known devices file at {}", filePath_.string());
        return devices;
    }

    try {
        std::ifstream file(filePath_);
        if (!file) {
            spdlog::error("Failed to open devices file: {}", filePath_.string());
            return devices;
        }

        nlohmann::json j;
        file >> j;
        if (!j.is_array()) {
            spdlog::error("Devices file {} does not hold an array", filePath_.string());
            return devices;
        }

        for (const auto& entry : j) {
            try {
                devices.push_back(fromJson(entry));
            } catch (const std::exception& e) {
                spdlog::warn("Skipping malformed device entry: {}", e.what());
            }
        }

        spdlog::debug("Loaded {} devices from {}", devices.size(), filePath_.string());
    } catch (const std::exception& e) {
        spdlog::error("Failed to load devices: {}", e.what());
        devices.clear();
    }

    return devices;
}

bool JsonDeviceStorage::saveDevices(const std::vector<core::NetworkDevice>& devices) {
    std::lock_guard lock(mutex_);

    try {
        auto j = nlohmann::json::array();
        for (const auto& device : devices) {
            j.push_back(toJson(device));
        }

        auto tempPath = filePath_;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath, std::ios::trunc);
            if (!file) {
                spdlog::error("Failed to open devices file for writing: {}", tempPath.string());
                return false;
            }
            file << j.dump(2);
            if (!file) {
                spdlog::error("Failed to write devices file: {}", tempPath.string());
                return false;
            }
        }

        std::filesystem::rename(tempPath, filePath_);
        spdlog::debug("Saved {} devices to {}", devices.size(), filePath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save devices: {}", e.what());
        return false;
    }
}

nlohmann::json JsonDeviceStorage::toJson(const core::NetworkDevice& device) {
    nlohmann::json j;
    j["address"] = device.address;
    j["name"] = device.name;
    j["type"] = device.type;
    j["mac_address"] = device.macAddress ? nlohmann::json(*device.macAddress) : nullptr;
    j["is_online"] = device.isOnline;
    if (device.lastSeen) {
        j["last_seen"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                             device.lastSeen->time_since_epoch())
                             .count();
    } else {
        j["last_seen"] = nullptr;
    }
    j["response_time_us"] = device.responseTime.count();
    return j;
}

core::NetworkDevice JsonDeviceStorage::fromJson(const nlohmann::json& j) {
    core::NetworkDevice device;
    device.address = j.at("address").get<std::string>();
    device.name = j.value("name", core::NetworkDevice::placeholderName(device.address));
    device.type = j.value("type", "");
    if (j.contains("mac_address") && j["mac_address"].is_string()) {
        device.macAddress = j["mac_address"].get<std::string>();
    }
    device.isOnline = j.value("is_online", false);
    if (j.contains("last_seen") && j["last_seen"].is_number_integer()) {
        device.lastSeen = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(j["last_seen"].get<int64_t>()));
    }
    device.responseTime = std::chrono::microseconds(j.value("response_time_us", int64_t{0}));
    return device;
}

} // namespace lanscout::infra
