#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace lanscout::infra {

/**
 * @brief I/O worker pool shared by the probes and the passive discoveries.
 *
 * Workers only run completion handlers; nothing posted here may block.
 * Sweep workers that need a result wait on futures fulfilled by these
 * handlers. A handler that throws is logged and the worker keeps running.
 */
class AsioContext {
public:
    using Strand = asio::strand<asio::io_context::executor_type>;

    explicit AsioContext(size_t workers = std::thread::hardware_concurrency());
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the workers. Calling it again while running does nothing.
     */
    void start();

    /**
     * @brief Cancels outstanding work and joins the workers.
     *
     * The pool can be started again afterwards.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] size_t workerCount() const { return workerCount_; }

    asio::io_context& ioContext() { return ioContext_; }

    /**
     * @brief Serialises the handlers of one socket owner.
     */
    Strand makeStrand() { return asio::make_strand(ioContext_); }

    /**
     * @brief Runs @p fn on @p strand and waits until it has finished.
     *
     * Runs inline when the pool has no workers or the caller is already on
     * the strand.
     * @return False if @p fn did not complete within @p timeout.
     */
    bool runOn(Strand& strand, std::function<void()> fn,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

private:
    void runWorker(size_t index);

    asio::io_context ioContext_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> keepAlive_;
    std::vector<std::jthread> workers_;
    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    size_t workerCount_;
};

} // namespace lanscout::infra
