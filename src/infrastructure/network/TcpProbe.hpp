/**
 * @file TcpProbe.hpp
 * @brief Short-lived TCP exchanges with a hard deadline.
 */

#pragma once

#include "infrastructure/network/AsioContext.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>

namespace lanscout::infra {

/**
 * @brief One connect, optional write, bounded read.
 */
struct TcpRequest {
    std::string address;           ///< Dotted-quad IPv4 address
    uint16_t port{0};              ///< Destination port
    std::string payload;           ///< Written after connect when non-empty
    size_t maxResponseBytes{0};    ///< Zero skips reading entirely
    bool readUntilEof{false};      ///< Keep reading until EOF or the byte limit
    std::chrono::milliseconds timeout{1000}; ///< Deadline for the whole exchange
};

/**
 * @brief Outcome of a TCP exchange. Timeouts and refusals are not exceptional.
 */
struct TcpExchangeResult {
    bool connected{false};     ///< The connection was accepted
    bool success{false};       ///< Every requested step completed
    std::string response;      ///< Bytes received (at most maxResponseBytes)
    std::string errorMessage;  ///< Reason for failure
};

/**
 * @brief Runs TCP exchanges on the shared I/O pool.
 *
 * Each exchange races its socket operations against a deadline timer; the
 * first to finish wins and the other is discarded. Socket and timer share a
 * strand so completion handlers never run concurrently.
 */
class TcpProbe {
public:
    using ExchangeCallback = std::function<void(TcpExchangeResult)>;
    using CancelHandle = std::function<void()>;

    explicit TcpProbe(AsioContext& context);

    /**
     * @brief Starts an exchange and returns immediately.
     * @param request Target and payload.
     * @param callback Invoked exactly once on an I/O thread. Must not block.
     * @return Handle that abandons the exchange when invoked.
     */
    CancelHandle exchangeAsync(const TcpRequest& request, ExchangeCallback callback);

    /**
     * @brief Runs an exchange and waits for it.
     * @note Blocks the calling thread; never call from an I/O thread.
     */
    TcpExchangeResult exchange(const TcpRequest& request, std::stop_token stopToken = {});

    /**
     * @brief Checks whether @p port accepts connections within @p timeout.
     */
    bool isPortOpen(const std::string& address, uint16_t port, std::chrono::milliseconds timeout,
                    std::stop_token stopToken = {});

private:
    AsioContext& context_;
};

} // namespace lanscout::infra
