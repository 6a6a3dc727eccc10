/**
 * @file DnsMessage.hpp
 * @brief DNS wire format encoding and decoding for multicast DNS.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace lanscout::infra {

/**
 * @brief Raised when a datagram is not a well-formed DNS message.
 */
class DnsParseError : public std::runtime_error {
public:
    explicit DnsParseError(const std::string& message) : std::runtime_error(message) {}
};

namespace dns {

constexpr uint16_t TYPE_A = 1;
constexpr uint16_t TYPE_PTR = 12;
constexpr uint16_t TYPE_TXT = 16;
constexpr uint16_t TYPE_AAAA = 28;
constexpr uint16_t TYPE_SRV = 33;
constexpr uint16_t CLASS_IN = 1;
constexpr uint16_t UNICAST_RESPONSE_BIT = 0x8000; ///< QU bit in the question class
constexpr uint16_t CACHE_FLUSH_BIT = 0x8000;      ///< Cache-flush bit in the record class

} // namespace dns

struct DnsQuestion {
    std::string name;
    uint16_t type{0};
    uint16_t qclass{0};
};

/**
 * @brief A resource record. Type-specific fields are filled for A, PTR and SRV.
 */
struct DnsRecord {
    std::string name;        ///< Owner name without trailing dot
    uint16_t type{0};
    uint16_t rrClass{0};     ///< Class with the cache-flush bit cleared
    uint32_t ttl{0};
    std::string address;     ///< A: dotted-quad address
    std::string target;      ///< PTR: domain name, SRV: target host
    uint16_t port{0};        ///< SRV
    uint16_t priority{0};    ///< SRV
    uint16_t weight{0};      ///< SRV
};

/**
 * @brief A parsed DNS message.
 */
struct DnsMessage {
    uint16_t id{0};
    uint16_t flags{0};
    std::vector<DnsQuestion> questions;
    std::vector<DnsRecord> answers;
    std::vector<DnsRecord> authorities;
    std::vector<DnsRecord> additionals;

    [[nodiscard]] bool isResponse() const { return (flags & 0x8000) != 0; }

    /**
     * @brief Answers followed by additional records.
     */
    [[nodiscard]] std::vector<DnsRecord> allRecords() const;

    /**
     * @brief Decodes a message, following name compression pointers.
     * @throws DnsParseError on truncation, pointer loops or oversize labels.
     */
    static DnsMessage parse(const uint8_t* data, size_t length);

    /**
     * @brief Encodes a query with one question per name.
     * @param names Fully qualified names such as "_http._tcp.local".
     * @param type Query type, usually dns::TYPE_PTR.
     * @param unicastResponse Set the QU bit so responders answer by unicast.
     */
    static std::vector<uint8_t> buildQuery(const std::vector<std::string>& names, uint16_t type,
                                           bool unicastResponse);

    /**
     * @brief Appends an encoded domain name (no compression).
     * @throws std::invalid_argument for labels longer than 63 bytes.
     */
    static void encodeName(const std::string& name, std::vector<uint8_t>& out);
};

} // namespace lanscout::infra
