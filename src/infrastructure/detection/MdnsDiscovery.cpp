#include "infrastructure/detection/MdnsDiscovery.hpp"

#include "infrastructure/detection/TextMatch.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string_view>

namespace lanscout::infra {

namespace {

using SteadyClock = std::chrono::steady_clock;

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string stripLocal(const std::string& host) {
    return endsWith(host, ".local") ? host.substr(0, host.size() - 6) : host;
}

} // namespace

MdnsDiscovery::MdnsDiscovery(AsioContext& context, std::shared_ptr<PassiveDiscoveryCache> cache)
    : context_(context),
      cache_(std::move(cache)),
      strand_(context.makeStrand()),
      socket_(strand_) {}

const std::vector<std::string>& MdnsDiscovery::serviceTypes() {
    static const std::vector<std::string> types{
        "_http._tcp.local",          "_https._tcp.local",         "_ssh._tcp.local",
        "_sftp-ssh._tcp.local",      "_printer._tcp.local",       "_ipp._tcp.local",
        "_scanner._tcp.local",       "_smb._tcp.local",           "_afpovertcp._tcp.local",
        "_device-info._tcp.local",   "_workstation._tcp.local",   "_airplay._tcp.local",
        "_homekit._tcp.local",       "_hap._tcp.local",           "_raop._tcp.local",
        "_googlecast._tcp.local",    "_spotify-connect._tcp.local", "_sonos._tcp.local",
        "_hue._tcp.local",           "_homeassistant._tcp.local", "_octoprint._tcp.local",
        "_mqtt._tcp.local",          "_rfb._tcp.local",           "_daap._tcp.local",
        "_radicale._tcp.local",
    };
    return types;
}

std::optional<std::string> MdnsDiscovery::serviceHint(const std::string& serviceType) {
    struct HintRule {
        std::vector<std::string_view> needles;
        const char* hint;
    };

    // First match wins; "_https" matches "_http"
    static const std::vector<HintRule> rules{
        {{"_printer"}, "Printer"},
        {{"_scanner"}, "Scanner"},
        {{"_airplay"}, "AirPlay Device"},
        {{"_homekit", "_hap"}, "HomeKit Device"},
        {{"_googlecast"}, "Chromecast"},
        {{"_spotify"}, "Spotify Connect"},
        {{"_sonos"}, "Sonos Speaker"},
        {{"_hue"}, "Philips Hue"},
        {{"_homeassistant"}, "Home Assistant"},
        {{"_octoprint"}, "OctoPrint"},
        {{"_mqtt"}, "MQTT Broker"},
        {{"_smb", "_afp"}, "File Server"},
        {{"_ssh", "_sftp"}, "SSH Server"},
        {{"_http"}, "Web Server"},
        {{"_workstation"}, "Workstation"},
        {{"_rfb"}, "VNC Server"},
        {{"_raop"}, "Audio Receiver"},
    };

    auto lower = text::toLower(serviceType);
    for (const auto& rule : rules) {
        for (auto needle : rule.needles) {
            if (text::contains(lower, needle)) {
                return std::string(rule.hint);
            }
        }
    }
    return std::nullopt;
}

std::vector<std::pair<std::string, std::string>> MdnsDiscovery::extractLabels(
    const DnsMessage& message, const std::string& senderAddress) {
    std::vector<std::pair<std::string, std::string>> labels;
    auto records = message.allRecords();

    std::vector<std::string> allAddresses;
    for (const auto& record : records) {
        if (record.type == dns::TYPE_A &&
            std::find(allAddresses.begin(), allAddresses.end(), record.address) ==
                allAddresses.end()) {
            allAddresses.push_back(record.address);
        }
    }

    for (const auto& ptr : records) {
        if (ptr.type != dns::TYPE_PTR) {
            continue;
        }

        auto serviceType = text::toLower(ptr.name);
        if (serviceType.empty() || serviceType.front() != '_' ||
            !(endsWith(serviceType, "._tcp.local") || endsWith(serviceType, "._udp.local"))) {
            continue;
        }

        const auto& instance = ptr.target;
        auto instanceName = instance.substr(0, instance.find('.'));
        // Service enumeration answers point at other service types
        if (!instanceName.empty() && instanceName.front() == '_') {
            continue;
        }

        std::string host;
        for (const auto& srv : records) {
            if (srv.type == dns::TYPE_SRV && text::toLower(srv.name) == text::toLower(instance)) {
                host = srv.target;
                break;
            }
        }

        std::vector<std::string> parts;
        if (!instanceName.empty()) {
            parts.push_back(instanceName);
        }
        if (auto hint = serviceHint(serviceType)) {
            parts.push_back(*hint);
        } else if (!host.empty()) {
            parts.push_back(stripLocal(host));
        }

        std::string label = "mDNS Device";
        if (!parts.empty()) {
            label = parts.front();
            for (size_t i = 1; i < parts.size(); ++i) {
                label += " - " + parts[i];
            }
            label += " (mDNS)";
        }

        std::vector<std::string> addresses;
        if (!host.empty()) {
            for (const auto& a : records) {
                if (a.type == dns::TYPE_A && text::toLower(a.name) == text::toLower(host)) {
                    addresses.push_back(a.address);
                }
            }
        }
        if (addresses.empty()) {
            addresses = allAddresses;
        }
        if (addresses.empty() && !senderAddress.empty()) {
            addresses.push_back(senderAddress);
        }

        for (const auto& address : addresses) {
            labels.emplace_back(address, label);
        }
    }

    return labels;
}

bool MdnsDiscovery::start() {
    auto group = asio::ip::make_address_v4(MULTICAST_ADDRESS);

    try {
        socket_.open(asio::ip::udp::v4());
        socket_.set_option(asio::socket_base::reuse_address(true));
        socket_.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), MULTICAST_PORT));
        socket_.set_option(asio::ip::multicast::join_group(group));
        joinedGroup_ = true;
    } catch (const std::exception& e) {
        spdlog::debug("mDNS port {} unavailable ({}), using unicast responses", MULTICAST_PORT,
                      e.what());
        asio::error_code ignored;
        socket_.close(ignored);

        try {
            socket_.open(asio::ip::udp::v4());
            socket_.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), 0));
            unicastResponses_ = true;
        } catch (const std::exception& fallbackError) {
            spdlog::warn("mDNS discovery unavailable: {}", fallbackError.what());
            socket_.close(ignored);
            return false;
        }
    }

    auto self = shared_from_this();
    asio::dispatch(strand_, [self]() { self->receive(); });

    sendQueries();
    spdlog::info("mDNS discovery started ({} service types)", serviceTypes().size());
    return true;
}

void MdnsDiscovery::sendQueries() {
    lastQuery_ = SteadyClock::now().time_since_epoch().count();

    auto packet = std::make_shared<std::vector<uint8_t>>(
        DnsMessage::buildQuery(serviceTypes(), dns::TYPE_PTR, unicastResponses_));

    auto self = shared_from_this();
    asio::post(strand_, [self, packet]() {
        if (self->closed_) {
            return;
        }
        asio::ip::udp::endpoint target(asio::ip::make_address_v4(MULTICAST_ADDRESS),
                                       MULTICAST_PORT);
        self->socket_.async_send_to(asio::buffer(*packet), target,
                                    [packet](const asio::error_code& ec, size_t) {
                                        if (ec && ec != asio::error::operation_aborted) {
                                            spdlog::debug("mDNS query send failed: {}",
                                                          ec.message());
                                        }
                                    });
    });
}

bool MdnsDiscovery::sendQueriesIfIdle(SteadyClock::duration minSpacing) {
    auto now = SteadyClock::now().time_since_epoch().count();
    auto last = lastQuery_.load();
    if (now - last < minSpacing.count()) {
        return false;
    }
    if (!lastQuery_.compare_exchange_strong(last, now)) {
        return false;
    }
    sendQueries();
    return true;
}

void MdnsDiscovery::close() {
    if (closed_.exchange(true)) {
        return;
    }

    auto self = shared_from_this();
    bool finished = context_.runOn(strand_, [self]() {
        asio::error_code ignored;
        if (self->joinedGroup_) {
            self->socket_.set_option(
                asio::ip::multicast::leave_group(asio::ip::make_address_v4(MULTICAST_ADDRESS)),
                ignored);
        }
        self->socket_.close(ignored);
        spdlog::debug("mDNS discovery closed");
    });
    if (!finished) {
        spdlog::warn("mDNS discovery did not close in time; the multicast group may stay joined");
    }
}

void MdnsDiscovery::receive() {
    auto self = shared_from_this();
    socket_.async_receive_from(
        asio::buffer(buffer_), sender_, [self](const asio::error_code& ec, size_t bytes) {
            if (self->closed_ || ec == asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                spdlog::debug("mDNS receive error: {}", ec.message());
            } else {
                self->handleDatagram(self->buffer_.data(), bytes,
                                     self->sender_.address().to_string());
            }
            self->receive();
        });
}

void MdnsDiscovery::handleDatagram(const uint8_t* data, size_t length,
                                   const std::string& senderAddress) {
    try {
        auto message = DnsMessage::parse(data, length);
        if (!message.isResponse()) {
            return;
        }

        for (const auto& [address, label] : extractLabels(message, senderAddress)) {
            cache_->store(address, label, true);
            spdlog::debug("mDNS device {} -> {}", address, label);
        }
    } catch (const DnsParseError& e) {
        spdlog::debug("Dropping malformed mDNS datagram from {}: {}", senderAddress, e.what());
    }
}

} // namespace lanscout::infra
