#pragma once

#include "infrastructure/detection/DnsMessage.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace lanscout::test {

/**
 * @brief Assembles an uncompressed mDNS response with answer records only.
 */
class DnsBuilder {
public:
    DnsBuilder& ptr(const std::string& name, const std::string& target) {
        std::vector<uint8_t> rdata;
        infra::DnsMessage::encodeName(target, rdata);
        return record(name, infra::dns::TYPE_PTR, rdata);
    }

    DnsBuilder& srv(const std::string& name, const std::string& target, uint16_t port) {
        std::vector<uint8_t> rdata{0, 0, 0, 0};
        rdata.push_back(static_cast<uint8_t>(port >> 8));
        rdata.push_back(static_cast<uint8_t>(port & 0xFF));
        infra::DnsMessage::encodeName(target, rdata);
        return record(name, infra::dns::TYPE_SRV, rdata);
    }

    DnsBuilder& a(const std::string& name, std::array<uint8_t, 4> address) {
        return record(name, infra::dns::TYPE_A,
                      std::vector<uint8_t>(address.begin(), address.end()));
    }

    [[nodiscard]] std::vector<uint8_t> build() const {
        std::vector<uint8_t> out{0x00, 0x00, 0x84, 0x00, 0x00, 0x00};
        out.push_back(static_cast<uint8_t>(count_ >> 8));
        out.push_back(static_cast<uint8_t>(count_ & 0xFF));
        out.insert(out.end(), {0x00, 0x00, 0x00, 0x00});
        out.insert(out.end(), records_.begin(), records_.end());
        return out;
    }

private:
    DnsBuilder& record(const std::string& name, uint16_t type, const std::vector<uint8_t>& rdata) {
        infra::DnsMessage::encodeName(name, records_);
        uint16_t rrClass = infra::dns::CLASS_IN | infra::dns::CACHE_FLUSH_BIT;
        records_.insert(records_.end(),
                        {static_cast<uint8_t>(type >> 8), static_cast<uint8_t>(type & 0xFF),
                         static_cast<uint8_t>(rrClass >> 8), static_cast<uint8_t>(rrClass & 0xFF),
                         0x00, 0x00, 0x00, 0x78, static_cast<uint8_t>(rdata.size() >> 8),
                         static_cast<uint8_t>(rdata.size() & 0xFF)});
        records_.insert(records_.end(), rdata.begin(), rdata.end());
        ++count_;
        return *this;
    }

    std::vector<uint8_t> records_;
    uint16_t count_{0};
};

} // namespace lanscout::test
