/**
 * @file DetectorChain.hpp
 * @brief Priority-ordered device classification.
 */

#pragma once

#include "core/services/IDeviceTypeDetector.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace lanscout::infra {

/**
 * @brief Runs registered detectors in descending priority until one answers.
 *
 * Detectors with equal priority keep their registration order. A detector
 * that throws despite its contract is logged and skipped. Registration is
 * thread-safe; a classification in progress keeps the detector set it started
 * with.
 */
class DetectorChain {
public:
    using DetectorPtr = std::shared_ptr<core::IDeviceTypeDetector>;

    DetectorChain() = default;
    explicit DetectorChain(std::vector<DetectorPtr> detectors);

    /**
     * @brief Registers a detector at its own priority.
     */
    void add(DetectorPtr detector);

    /**
     * @brief Returns the first non-empty label, consulting detectors in order.
     * @param address IPv4 address of an online device.
     * @param stopToken Stops the chain before the next detector.
     */
    std::optional<std::string> classify(const std::string& address,
                                        std::stop_token stopToken = {}) const;

    /**
     * @brief Returns the detectors in the order they are consulted.
     */
    [[nodiscard]] std::vector<DetectorPtr> detectors() const;

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<DetectorPtr> detectors_;
};

} // namespace lanscout::infra
