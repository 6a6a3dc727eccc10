#include "infrastructure/network/PingProbe.hpp"

#include "infrastructure/network/IpRange.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <random>

#ifdef __linux__
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace lanscout::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr auto POLL_SLICE = std::chrono::milliseconds(100);

#ifdef __linux__
class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};
#endif

} // namespace

PingProbe::PingProbe() {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    spdlog::debug("PingProbe initialized with identifier: {}", identifier_);
}

uint16_t PingProbe::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> PingProbe::buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(64, 0);

    packet[0] = ICMP_ECHO_REQUEST;
    packet[1] = 0;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[8], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

std::optional<int> PingProbe::matchEchoReply(const uint8_t* data, size_t length, bool hasIpHeader,
                                             std::optional<uint16_t> identifier,
                                             uint16_t sequence) {
    size_t offset = 0;
    int ttl = -1;

    if (hasIpHeader) {
        if (length < 20) {
            return std::nullopt;
        }
        offset = static_cast<size_t>((data[0] & 0x0F) * 4);
        ttl = data[8];
    }

    if (length < offset + 8) {
        return std::nullopt;
    }

    const uint8_t* icmp = data + offset;
    if (icmp[0] != ICMP_ECHO_REPLY) {
        return std::nullopt;
    }

    uint16_t recvId = static_cast<uint16_t>((icmp[4] << 8) | icmp[5]);
    uint16_t recvSeq = static_cast<uint16_t>((icmp[6] << 8) | icmp[7]);

    if (identifier && recvId != *identifier) {
        return std::nullopt;
    }
    if (recvSeq != sequence) {
        return std::nullopt;
    }
    return ttl;
}

#ifdef __linux__
core::PingResult PingProbe::exchange(int fd, bool rawSocket, const std::string& address,
                                     std::chrono::milliseconds timeout, std::stop_token stopToken,
                                     core::PingResult result) {
    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    inet_pton(AF_INET, address.c_str(), &dest.sin_addr);

    uint16_t seq = sequenceNumber_++;
    auto packet = buildIcmpEchoRequest(identifier_, seq);

    auto sendTime = std::chrono::steady_clock::now();
    auto deadline = sendTime + timeout;

    ssize_t sent = sendto(fd, packet.data(), packet.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        result.errorMessage = std::string("Failed to send ICMP packet: ") + std::strerror(errno);
        return result;
    }

    std::optional<uint16_t> expectedId;
    if (rawSocket) {
        expectedId = identifier_;
    }

    std::array<uint8_t, 1024> recvBuffer{};

    while (true) {
        if (stopToken.stop_requested()) {
            result.errorMessage = "Cancelled";
            return result;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.errorMessage = "Timeout";
            return result;
        }

        auto wait = std::min<std::chrono::milliseconds>(
            POLL_SLICE, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
                            std::chrono::milliseconds(1));

        struct pollfd pfd {};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(wait.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.errorMessage = std::string("poll failed: ") + std::strerror(errno);
            return result;
        }
        if (ready == 0) {
            continue;
        }

        struct sockaddr_in from {};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(fd, recvBuffer.data(), recvBuffer.size(), 0,
                                    reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        auto recvTime = std::chrono::steady_clock::now();

        if (received < 0) {
            continue;
        }

        // Raw sockets see every ICMP packet delivered to the host
        if (from.sin_addr.s_addr != dest.sin_addr.s_addr) {
            continue;
        }

        auto ttl = matchEchoReply(recvBuffer.data(), static_cast<size_t>(received), rawSocket,
                                  expectedId, seq);
        if (!ttl) {
            continue;
        }

        result.success = true;
        result.latency = std::chrono::duration_cast<std::chrono::microseconds>(recvTime - sendTime);
        if (*ttl >= 0) {
            result.ttl = *ttl;
        }

        spdlog::debug("Ping to {} successful: {:.2f}ms", address, result.latency.count() / 1000.0);
        return result;
    }
}
#endif

core::PingResult PingProbe::probe(const std::string& address, std::chrono::milliseconds timeout,
                                  std::stop_token stopToken) {
    core::PingResult result;
    result.address = address;
    result.timestamp = std::chrono::system_clock::now();
    result.success = false;

    if (!IpRangeEnumerator::isValidIpv4(address)) {
        result.errorMessage = "Invalid IPv4 address";
        return result;
    }

#ifdef __linux__
    SocketHandle rawSock(socket(AF_INET, SOCK_RAW, IPPROTO_ICMP));
    if (rawSock.valid()) {
        return exchange(rawSock.get(), true, address, timeout, stopToken, result);
    }

    SocketHandle dgramSock(socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP));
    if (!dgramSock.valid()) {
        result.errorMessage = "Failed to create ICMP socket (need CAP_NET_RAW or ping_group_range)";
        spdlog::debug("Ping to {} failed: {}", address, result.errorMessage);
        return result;
    }
    return exchange(dgramSock.get(), false, address, timeout, stopToken, result);
#else
    result.errorMessage = "ICMP ping not implemented for this platform";
    return result;
#endif
}

} // namespace lanscout::infra
