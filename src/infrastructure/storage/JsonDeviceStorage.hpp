#pragma once

#include "core/services/IDeviceStorage.hpp"

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>

namespace lanscout::infra {

/**
 * @brief Keeps the known device list in a JSON file.
 *
 * The file holds an array of objects with the keys address, name, type,
 * mac_address, is_online, last_seen (epoch milliseconds) and
 * response_time_us. Saves go through a temporary file and a rename.
 */
class JsonDeviceStorage : public core::IDeviceStorage {
public:
    /**
     * @param dataDir Directory holding known_devices.json; created if missing.
     */
    explicit JsonDeviceStorage(const std::filesystem::path& dataDir);

    std::vector<core::NetworkDevice> loadDevices() override;
    bool saveDevices(const std::vector<core::NetworkDevice>& devices) override;

    [[nodiscard]] const std::filesystem::path& filePath() const { return filePath_; }

    static nlohmann::json toJson(const core::NetworkDevice& device);
    static core::NetworkDevice fromJson(const nlohmann::json& j);

private:
    std::filesystem::path filePath_;
    std::mutex mutex_;
};

} // namespace lanscout::infra
