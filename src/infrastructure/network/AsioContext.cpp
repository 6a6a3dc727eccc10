#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <future>

namespace lanscout::infra {

AsioContext::AsioContext(size_t workers) : workerCount_(workers == 0 ? 1 : workers) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    std::lock_guard lock(lifecycleMutex_);
    if (running_) {
        return;
    }

    keepAlive_.emplace(ioContext_.get_executor());
    for (size_t i = 0; i < workerCount_; ++i) {
        workers_.emplace_back([this, i] { runWorker(i); });
    }
    running_ = true;
    spdlog::debug("I/O pool running with {} workers", workerCount_);
}

void AsioContext::stop() {
    std::lock_guard lock(lifecycleMutex_);
    if (!running_) {
        return;
    }

    keepAlive_.reset();
    ioContext_.stop();
    workers_.clear();
    ioContext_.restart();
    running_ = false;
    spdlog::debug("I/O pool stopped");
}

bool AsioContext::runOn(Strand& strand, std::function<void()> fn,
                        std::chrono::milliseconds timeout) {
    if (!running_ || strand.running_in_this_thread()) {
        fn();
        return true;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();
    asio::dispatch(strand, [fn = std::move(fn), done]() {
        fn();
        done->set_value();
    });
    return finished.wait_for(timeout) == std::future_status::ready;
}

void AsioContext::runWorker(size_t index) {
    for (;;) {
        try {
            ioContext_.run();
            return;
        } catch (const std::exception& e) {
            spdlog::error("I/O worker {}: handler threw: {}", index, e.what());
        }
    }
}

} // namespace lanscout::infra
