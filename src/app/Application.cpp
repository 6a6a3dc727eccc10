#include "app/Application.hpp"

#include "infrastructure/detection/DetectorFactory.hpp"
#include "infrastructure/network/ArpTableResolver.hpp"
#include "infrastructure/network/DnsHostnameResolver.hpp"
#include "infrastructure/network/LocalSubnetProvider.hpp"
#include "infrastructure/network/PingProbe.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <condition_variable>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace lanscout::app {

namespace {

constexpr const char* VERSION = "1.0.0";

} // namespace

Application::Application(LaunchOptions options) : options_(std::move(options)) {
    if (options_.configDir.empty()) {
        options_.configDir = defaultConfigDir();
    }

    config_ = std::make_unique<infra::ConfigManager>(options_.configDir);
    bool loaded = config_->load();

    initializeLogging();
    if (!loaded) {
        spdlog::warn("Using default configuration; {} could not be read",
                     config_->configPath().string());
    }
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    if (scanner_) {
        scanner_->stopScanning();
        scanner_->flushEvents();
        for (auto id : subscriptions_) {
            scanner_->unsubscribe(id);
        }
    }

    // Detectors hold sockets on the io pool, so they go before it stops.
    scanner_.reset();

    if (asioContext_) {
        asioContext_->stop();
    }
}

void Application::initializeLogging() {
    auto logPath = config_->logPath();

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::from_str(config_->config().logLevel));

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("lanscout", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("LanScout {} starting...", VERSION);
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    // Asio context
    asioContext_ = std::make_unique<infra::AsioContext>(4);
    asioContext_->start();

    // Network services
    tcpProbe_ = std::make_unique<infra::TcpProbe>(*asioContext_);
    httpClient_ = std::make_unique<infra::HttpClient>(*tcpProbe_);

    // Detectors
    infra::DetectorContext context{*asioContext_, *tcpProbe_, *httpClient_};
    auto chain = infra::DetectorFactory::createChain(context, cfg.ports, cfg.detectors);

    // Scanner
    infra::NetworkScanner::Dependencies deps;
    deps.pingProbe = std::make_shared<infra::PingProbe>();
    deps.detectorChain = chain;
    deps.subnetProvider = std::make_shared<infra::LocalSubnetProvider>();
    deps.hostnameResolver = std::make_shared<infra::DnsHostnameResolver>();
    deps.macResolver = std::make_shared<infra::ArpTableResolver>();
    scanner_ = std::make_unique<infra::NetworkScanner>(cfg.scanner, std::move(deps));

    // Known devices
    storage_ = std::make_unique<infra::JsonDeviceStorage>(options_.configDir);
    scanner_->restoreDevices(storage_->loadDevices());

    subscribeToEvents();

    spdlog::info("Application components initialized ({} detectors)", chain->size());
}

void Application::subscribeToEvents() {
    subscriptions_.push_back(scanner_->subscribe(
        core::ScanEventType::DeviceDiscovered, [](const core::ScanEvent& event) {
            if (!event.device) {
                return;
            }
            const auto& device = *event.device;
            if (device.isOnline) {
                spdlog::info("{:<15} {:<30} {:<40} {:.1f} ms {}", device.address, device.name,
                             device.displayType(), device.responseTimeMs(),
                             device.macAddress.value_or(""));
            } else {
                spdlog::info("{:<15} {:<30} offline", device.address, device.name);
            }
        }));

    subscriptions_.push_back(scanner_->subscribe(
        core::ScanEventType::ScanProgress,
        [](const core::ScanEvent& event) { spdlog::debug("{}", event.message); }));

    subscriptions_.push_back(scanner_->subscribe(
        core::ScanEventType::LastScanTimeChanged,
        [this](const core::ScanEvent&) { persistDevices(); }));

    subscriptions_.push_back(scanner_->subscribe(
        core::ScanEventType::NextScanTimeChanged, [](const core::ScanEvent& event) {
            if (event.time) {
                auto wait = std::chrono::duration_cast<std::chrono::seconds>(
                    *event.time - std::chrono::system_clock::now());
                spdlog::info("Next scan in {} s", wait.count());
            }
        }));
}

void Application::persistDevices() {
    if (!storage_->saveDevices(scanner_->discoveredDevices())) {
        spdlog::warn("Known devices were not saved");
    }
}

int Application::run(std::stop_token stopToken) {
    if (options_.address) {
        auto devices = scanner_->scanSingleDevice(*options_.address);
        scanner_->flushEvents();
        if (devices.empty()) {
            return 1;
        }
        persistDevices();
        return 0;
    }

    if (options_.once || !config_->config().scanner.enableContinuousScanning) {
        scanner_->scanNetwork();
        scanner_->flushEvents();
        return 0;
    }

    scanner_->startScanning();

    std::mutex mutex;
    std::condition_variable_any stopped;
    std::unique_lock lock(mutex);
    stopped.wait(lock, stopToken, [] { return false; });

    spdlog::info("Stop requested");
    scanner_->stopScanning();
    return 0;
}

LaunchOptions Application::parseArguments(const std::vector<std::string>& args) {
    LaunchOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--once") {
            options.once = true;
        } else if (arg == "--config" || arg == "--address") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " requires a value");
            }
            if (arg == "--config") {
                options.configDir = args[++i];
            } else {
                options.address = args[++i];
            }
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }

    return options;
}

std::filesystem::path Application::defaultConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "lanscout";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "lanscout";
    }
    return std::filesystem::current_path() / ".lanscout";
}

} // namespace lanscout::app
