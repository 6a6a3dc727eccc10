#include "infrastructure/detection/DnsMessage.hpp"

#include <sstream>

namespace lanscout::infra {

namespace {

constexpr size_t HEADER_SIZE = 12;
constexpr int MAX_POINTER_JUMPS = 32;

class Reader {
public:
    Reader(const uint8_t* data, size_t length) : data_(data), length_(length) {}

    void require(size_t bytes) const {
        if (offset_ + bytes > length_) {
            throw DnsParseError("Truncated DNS message");
        }
    }

    uint8_t u8() {
        require(1);
        return data_[offset_++];
    }

    uint16_t u16() {
        require(2);
        uint16_t value = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
        offset_ += 2;
        return value;
    }

    uint32_t u32() {
        uint32_t high = u16();
        uint32_t low = u16();
        return (high << 16) | low;
    }

    std::string name() {
        std::string result;
        size_t position = offset_;
        bool jumped = false;
        int jumps = 0;

        while (true) {
            if (position >= length_) {
                throw DnsParseError("Truncated domain name");
            }
            uint8_t len = data_[position];

            if ((len & 0xC0) == 0xC0) {
                if (position + 1 >= length_) {
                    throw DnsParseError("Truncated compression pointer");
                }
                if (++jumps > MAX_POINTER_JUMPS) {
                    throw DnsParseError("Compression pointer loop");
                }
                size_t pointer = static_cast<size_t>(((len & 0x3F) << 8) | data_[position + 1]);
                if (!jumped) {
                    offset_ = position + 2;
                    jumped = true;
                }
                position = pointer;
                continue;
            }
            if ((len & 0xC0) != 0) {
                throw DnsParseError("Unsupported label type");
            }

            if (len == 0) {
                if (!jumped) {
                    offset_ = position + 1;
                }
                break;
            }

            if (position + 1 + len > length_) {
                throw DnsParseError("Truncated label");
            }
            if (!result.empty()) {
                result += '.';
            }
            result.append(reinterpret_cast<const char*>(data_ + position + 1), len);
            position += 1 + len;
        }

        return result;
    }

    void skip(size_t bytes) {
        require(bytes);
        offset_ += bytes;
    }

    [[nodiscard]] size_t offset() const { return offset_; }
    void seek(size_t offset) { offset_ = offset; }

private:
    const uint8_t* data_;
    size_t length_;
    size_t offset_{0};
};

DnsRecord readRecord(Reader& reader) {
    DnsRecord record;
    record.name = reader.name();
    record.type = reader.u16();
    record.rrClass = reader.u16() & static_cast<uint16_t>(~dns::CACHE_FLUSH_BIT);
    record.ttl = reader.u32();
    uint16_t rdLength = reader.u16();
    reader.require(rdLength);
    size_t rdataEnd = reader.offset() + rdLength;

    switch (record.type) {
    case dns::TYPE_A: {
        if (rdLength != 4) {
            throw DnsParseError("A record with invalid length");
        }
        std::ostringstream address;
        address << static_cast<int>(reader.u8()) << '.' << static_cast<int>(reader.u8()) << '.'
                << static_cast<int>(reader.u8()) << '.' << static_cast<int>(reader.u8());
        record.address = address.str();
        break;
    }
    case dns::TYPE_PTR:
        record.target = reader.name();
        break;
    case dns::TYPE_SRV:
        record.priority = reader.u16();
        record.weight = reader.u16();
        record.port = reader.u16();
        record.target = reader.name();
        break;
    default:
        break;
    }

    if (reader.offset() > rdataEnd) {
        throw DnsParseError("Record data overruns its length");
    }
    reader.seek(rdataEnd);
    return record;
}

} // namespace

std::vector<DnsRecord> DnsMessage::allRecords() const {
    std::vector<DnsRecord> records = answers;
    records.insert(records.end(), additionals.begin(), additionals.end());
    return records;
}

DnsMessage DnsMessage::parse(const uint8_t* data, size_t length) {
    if (length < HEADER_SIZE) {
        throw DnsParseError("DNS message shorter than header");
    }

    Reader reader(data, length);
    DnsMessage message;
    message.id = reader.u16();
    message.flags = reader.u16();
    uint16_t questionCount = reader.u16();
    uint16_t answerCount = reader.u16();
    uint16_t authorityCount = reader.u16();
    uint16_t additionalCount = reader.u16();

    for (uint16_t i = 0; i < questionCount; ++i) {
        DnsQuestion question;
        question.name = reader.name();
        question.type = reader.u16();
        question.qclass = reader.u16();
        message.questions.push_back(std::move(question));
    }
    for (uint16_t i = 0; i < answerCount; ++i) {
        message.answers.push_back(readRecord(reader));
    }
    for (uint16_t i = 0; i < authorityCount; ++i) {
        message.authorities.push_back(readRecord(reader));
    }
    for (uint16_t i = 0; i < additionalCount; ++i) {
        message.additionals.push_back(readRecord(reader));
    }

    return message;
}

void DnsMessage::encodeName(const std::string& name, std::vector<uint8_t>& out) {
    std::istringstream stream(name);
    std::string label;

    while (std::getline(stream, label, '.')) {
        if (label.empty()) {
            continue;
        }
        if (label.size() > 63) {
            throw std::invalid_argument("DNS label too long: " + label);
        }
        out.push_back(static_cast<uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
    }
    out.push_back(0);
}

std::vector<uint8_t> DnsMessage::buildQuery(const std::vector<std::string>& names, uint16_t type,
                                            bool unicastResponse) {
    std::vector<uint8_t> out(HEADER_SIZE, 0);
    // mDNS queries use id 0 and no flags
    out[4] = static_cast<uint8_t>(names.size() >> 8);
    out[5] = static_cast<uint8_t>(names.size() & 0xFF);

    uint16_t qclass = dns::CLASS_IN;
    if (unicastResponse) {
        qclass |= dns::UNICAST_RESPONSE_BIT;
    }

    for (const auto& name : names) {
        encodeName(name, out);
        out.push_back(static_cast<uint8_t>(type >> 8));
        out.push_back(static_cast<uint8_t>(type & 0xFF));
        out.push_back(static_cast<uint8_t>(qclass >> 8));
        out.push_back(static_cast<uint8_t>(qclass & 0xFF));
    }

    return out;
}

} // namespace lanscout::infra
