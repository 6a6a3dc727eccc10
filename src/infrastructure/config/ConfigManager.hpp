#pragma once

#include "core/types/ScanOptions.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace lanscout::infra {

/**
 * @brief Everything read from config.json.
 */
struct AppConfig {
    core::ScannerOptions scanner;          ///< "scanner" section
    core::PortDetectionOptions ports;      ///< "ports" section
    core::DetectorOptions detectors;       ///< "detectors" section
    std::string logLevel{"info"};          ///< "logging.level", console sink only
};

/**
 * @brief Owns the LanScout data directory and the config.json inside it.
 *
 * The directory also holds the known devices file and the rotating log.
 * Keys absent from the file keep their defaults, so older files stay
 * loadable. Values are not validated here; ScannerOptions::validate() and
 * PortDetectionOptions::validate() run when the scanner is built.
 */
class ConfigManager {
public:
    /**
     * @param configDir Data directory, created if missing.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Reads config.json, or writes the defaults if there is none yet.
     * @return false if the file exists but cannot be read or parsed.
     */
    bool load();

    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    [[nodiscard]] std::filesystem::path configPath() const { return configPath_; }
    [[nodiscard]] std::filesystem::path devicesPath() const;
    [[nodiscard]] std::filesystem::path logPath() const;
    [[nodiscard]] std::string configDir() const { return configDir_.string(); }

    static nlohmann::json toJson(const AppConfig& config);

    /**
     * @brief Overlays the keys present in @p j on a default AppConfig.
     */
    static AppConfig fromJson(const nlohmann::json& j);

private:
    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace lanscout::infra
