#include "app/Application.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <semaphore>
#include <thread>

namespace {

std::binary_semaphore signalled{0};

extern "C" void onSignal(int) {
    signalled.release();
}

void printUsage() {
    std::cerr << "usage: lanscout [--config DIR] [--once] [--address IP]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    lanscout::app::LaunchOptions options;
    try {
        options = lanscout::app::Application::parseArguments(
            std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        printUsage();
        return 2;
    }

    std::stop_source stopSource;
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    // Signal handlers may only post; the watcher turns that into a stop request.
    std::jthread signalWatcher([&stopSource](std::stop_token stopToken) {
        while (!stopToken.stop_requested()) {
            if (signalled.try_acquire_for(std::chrono::milliseconds(200))) {
                stopSource.request_stop();
                return;
            }
        }
    });

    try {
        lanscout::app::Application app(options);
        return app.run(stopSource.get_token());
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
