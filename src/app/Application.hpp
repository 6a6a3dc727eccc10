#pragma once

#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/HttpClient.hpp"
#include "infrastructure/network/TcpProbe.hpp"
#include "infrastructure/scanner/NetworkScanner.hpp"
#include "infrastructure/storage/JsonDeviceStorage.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace lanscout::app {

/**
 * @brief Command line choices for one run of the host.
 */
struct LaunchOptions {
    std::filesystem::path configDir;     ///< Holds config.json, known_devices.json and the log.
    bool once{false};                    ///< Run a single sweep and exit.
    std::optional<std::string> address;  ///< Scan one address and exit.
};

class Application {
public:
    /**
     * @throws core::ConfigurationError when the configured options are invalid.
     */
    explicit Application(LaunchOptions options);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs the selected mode until it finishes or @p stopToken fires.
     * @return Process exit code.
     */
    int run(std::stop_token stopToken);

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::AsioContext& asioContext() { return *asioContext_; }
    infra::NetworkScanner& scanner() { return *scanner_; }

    /**
     * @brief Parses argv into LaunchOptions.
     * @throws std::invalid_argument for unknown or incomplete arguments.
     */
    static LaunchOptions parseArguments(const std::vector<std::string>& args);

    static std::filesystem::path defaultConfigDir();

private:
    void initializeLogging();
    void initializeComponents();
    void subscribeToEvents();
    void persistDevices();

    LaunchOptions options_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<infra::TcpProbe> tcpProbe_;
    std::unique_ptr<infra::HttpClient> httpClient_;
    std::unique_ptr<infra::JsonDeviceStorage> storage_;
    std::unique_ptr<infra::NetworkScanner> scanner_;
    std::vector<int64_t> subscriptions_;
};

} // namespace lanscout::app
