/**
 * @file IpRange.hpp
 * @brief Lazy enumeration of the IPv4 addresses covered by one sweep.
 */

#pragma once

#include "core/services/ISubnetProvider.hpp"

#include <cstddef>
#include <iterator>
#include <string>

namespace lanscout::infra {

/**
 * @brief A finite, restartable sequence "{base}.{start}" .. "{base}.{end}".
 *
 * Addresses are produced on demand; iterating twice yields the same sequence.
 */
class IpRange {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = std::string;

        Iterator() = default;
        Iterator(const IpRange* range, int octet) : range_(range), octet_(octet) {}

        std::string operator*() const { return range_->base_ + "." + std::to_string(octet_); }

        Iterator& operator++() {
            ++octet_;
            return *this;
        }

        Iterator operator++(int) {
            Iterator copy = *this;
            ++octet_;
            return copy;
        }

        [[nodiscard]] int octet() const { return octet_; }

        bool operator==(const Iterator& other) const { return octet_ == other.octet_; }

    private:
        const IpRange* range_{nullptr};
        int octet_{0};
    };

    IpRange(std::string base, int startOctet, int endOctet);

    [[nodiscard]] Iterator begin() const { return Iterator(this, startOctet_); }
    [[nodiscard]] Iterator end() const { return Iterator(this, endOctet_ + 1); }

    [[nodiscard]] size_t size() const { return static_cast<size_t>(endOctet_ - startOctet_ + 1); }
    [[nodiscard]] const std::string& base() const { return base_; }
    [[nodiscard]] int startOctet() const { return startOctet_; }
    [[nodiscard]] int endOctet() const { return endOctet_; }

private:
    std::string base_;
    int startOctet_;
    int endOctet_;
};

/**
 * @brief Resolves sweep settings into an IpRange.
 */
class IpRangeEnumerator {
public:
    /**
     * @brief Builds the range for one sweep.
     *
     * @param subnetBase "auto" or three dotted octets such as "192.168.1".
     * @param startOctet First host octet (1..254).
     * @param endOctet Last host octet (startOctet..254).
     * @param subnetProvider Consulted only for "auto".
     * @return The validated range.
     * @throws core::ConfigurationError for malformed input or when "auto" finds
     *         no active IPv4 interface.
     */
    static IpRange resolve(const std::string& subnetBase, int startOctet, int endOctet,
                           core::ISubnetProvider& subnetProvider);

    /**
     * @brief Checks for exactly three dotted decimal octets in 0..255.
     */
    static bool isValidSubnetBase(const std::string& subnetBase);

    /**
     * @brief Checks for a dotted-quad IPv4 address.
     */
    static bool isValidIpv4(const std::string& address);
};

} // namespace lanscout::infra
