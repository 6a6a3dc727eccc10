#include "infrastructure/detection/SsdpDiscovery.hpp"

#include "infrastructure/detection/SsdpMessage.hpp"
#include "infrastructure/detection/UpnpDescription.hpp"
#include "infrastructure/network/IpRange.hpp"

#include <spdlog/spdlog.h>

namespace lanscout::infra {

namespace {

using SteadyClock = std::chrono::steady_clock;

asio::ip::udp::endpoint multicastEndpoint() {
    return {asio::ip::make_address_v4(SsdpMessage::MULTICAST_ADDRESS),
            SsdpMessage::MULTICAST_PORT};
}

} // namespace

SsdpDiscovery::SsdpDiscovery(AsioContext& context, HttpClient& httpClient,
                             std::shared_ptr<PassiveDiscoveryCache> cache, Settings settings)
    : context_(context),
      httpClient_(httpClient),
      cache_(std::move(cache)),
      settings_(settings),
      strand_(context.makeStrand()),
      searchSocket_(strand_),
      notifySocket_(strand_),
      searchTimer_(strand_) {}

bool SsdpDiscovery::start() {
    try {
        searchSocket_.open(asio::ip::udp::v4());
        searchSocket_.set_option(asio::ip::multicast::hops(4));
        searchSocket_.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), 0));
    } catch (const std::exception& e) {
        spdlog::warn("SSDP discovery unavailable: {}", e.what());
        asio::error_code ignored;
        searchSocket_.close(ignored);
        return false;
    }

    bool notifyOpen = false;
    if (settings_.listenForNotify) {
        try {
            notifySocket_.open(asio::ip::udp::v4());
            notifySocket_.set_option(asio::socket_base::reuse_address(true));
            notifySocket_.bind(
                asio::ip::udp::endpoint(asio::ip::udp::v4(), SsdpMessage::MULTICAST_PORT));
            notifySocket_.set_option(asio::ip::multicast::join_group(
                asio::ip::make_address_v4(SsdpMessage::MULTICAST_ADDRESS)));
            notifyOpen = true;
        } catch (const std::exception& e) {
            spdlog::debug("SSDP NOTIFY listener unavailable: {}", e.what());
            asio::error_code ignored;
            notifySocket_.close(ignored);
        }
    }

    auto self = shared_from_this();
    asio::dispatch(strand_, [self, notifyOpen]() {
        self->receive(self->searchSocket_, self->searchSlot_);
        if (notifyOpen) {
            self->receive(self->notifySocket_, self->notifySlot_);
        }
        self->scheduleSearch();
    });

    sendSearch();
    spdlog::info("SSDP discovery started (NOTIFY listener {})", notifyOpen ? "on" : "off");
    return true;
}

void SsdpDiscovery::sendSearch() {
    lastSearch_ = SteadyClock::now().time_since_epoch().count();

    auto self = shared_from_this();
    auto message = std::make_shared<std::string>(SsdpMessage::buildSearchRequest());
    asio::post(strand_, [self, message]() {
        if (self->closed_) {
            return;
        }
        self->searchSocket_.async_send_to(
            asio::buffer(*message), multicastEndpoint(),
            [message](const asio::error_code& ec, size_t) {
                if (ec && ec != asio::error::operation_aborted) {
                    spdlog::debug("M-SEARCH send failed: {}", ec.message());
                }
            });
    });
}

bool SsdpDiscovery::sendSearchIfIdle(SteadyClock::duration minSpacing) {
    auto now = SteadyClock::now().time_since_epoch().count();
    auto last = lastSearch_.load();
    if (now - last < minSpacing.count()) {
        return false;
    }
    if (!lastSearch_.compare_exchange_strong(last, now)) {
        return false;
    }
    sendSearch();
    return true;
}

void SsdpDiscovery::close() {
    if (closed_.exchange(true)) {
        return;
    }

    auto self = shared_from_this();
    bool finished = context_.runOn(strand_, [self]() {
        asio::error_code ignored;
        self->searchTimer_.cancel();
        if (self->notifySocket_.is_open()) {
            self->notifySocket_.set_option(
                asio::ip::multicast::leave_group(
                    asio::ip::make_address_v4(SsdpMessage::MULTICAST_ADDRESS)),
                ignored);
            self->notifySocket_.close(ignored);
        }
        self->searchSocket_.close(ignored);
        spdlog::debug("SSDP discovery closed");
    });
    if (!finished) {
        spdlog::warn("SSDP discovery did not close in time; the multicast group may stay joined");
    }
}

void SsdpDiscovery::receive(asio::ip::udp::socket& socket, ReceiveSlot& slot) {
    auto self = shared_from_this();
    socket.async_receive_from(
        asio::buffer(slot.buffer), slot.sender,
        [self, &socket, &slot](const asio::error_code& ec, size_t bytes) {
            if (self->closed_ || ec == asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                spdlog::debug("SSDP receive error: {}", ec.message());
            } else {
                self->handleDatagram(std::string(slot.buffer.data(), bytes),
                                     slot.sender.address().to_string());
            }
            self->receive(socket, slot);
        });
}

void SsdpDiscovery::scheduleSearch() {
    auto self = shared_from_this();
    searchTimer_.expires_after(settings_.searchInterval);
    searchTimer_.async_wait([self](const asio::error_code& ec) {
        if (ec || self->closed_) {
            return;
        }
        self->sendSearch();
        self->scheduleSearch();
    });
}

void SsdpDiscovery::handleDatagram(const std::string& datagram, const std::string& senderAddress) {
    auto message = SsdpMessage::parse(datagram);
    if (!message || !message->announcesDevice()) {
        return;
    }

    std::string address = senderAddress;
    auto location = message->location();
    auto server = message->server().value_or("");

    if (location) {
        auto url = HttpUrl::parse(*location);
        if (url && IpRangeEnumerator::isValidIpv4(url->host)) {
            address = url->host;
        }
    }
    if (!IpRangeEnumerator::isValidIpv4(address)) {
        return;
    }

    if (!location) {
        if (!server.empty()) {
            cache_->store(address, server + " (UPnP)", true);
        }
        return;
    }

    {
        std::lock_guard lock(descriptionsMutex_);
        auto& record = descriptions_[*location];
        auto now = SteadyClock::now();

        if (record.inFlight) {
            return;
        }
        if (record.fetchedAt != SteadyClock::time_point{} &&
            now - record.fetchedAt < settings_.descriptionRefresh) {
            if (!record.label.empty()) {
                cache_->store(record.address, record.label);
            }
            return;
        }

        record.inFlight = true;
        record.address = address;
    }

    fetchDescription(*location, address, server);
}

void SsdpDiscovery::fetchDescription(const std::string& location, const std::string& address,
                                     const std::string& server) {
    auto url = HttpUrl::parse(location);
    if (!url) {
        HttpResponse invalid;
        invalid.errorMessage = "Invalid LOCATION";
        onDescription(location, address, server, invalid);
        return;
    }

    // Descriptions served under a hostname are fetched from the announcing address
    std::string target = location;
    if (!IpRangeEnumerator::isValidIpv4(url->host)) {
        target = "http://" + address + ":" + std::to_string(url->port) + url->path;
    }

    auto self = shared_from_this();
    httpClient_.getAsync(target, settings_.descriptionTimeout,
                         [self, location, address, server](HttpResponse response) {
                             self->onDescription(location, address, server, response);
                         });
}

void SsdpDiscovery::onDescription(const std::string& location, const std::string& address,
                                  const std::string& server, const HttpResponse& response) {
    std::optional<std::string> label;

    if (response.success && response.statusCode == 200) {
        if (auto description = UpnpDescription::parse(response.body)) {
            label = description->buildLabel();
        }
    } else {
        spdlog::debug("UPnP description {} unavailable: {}", location,
                      response.errorMessage.empty() ? "HTTP " + std::to_string(response.statusCode)
                                                    : response.errorMessage);
    }

    if (!label && !server.empty()) {
        label = server + " (UPnP)";
    }

    {
        std::lock_guard lock(descriptionsMutex_);
        auto& record = descriptions_[location];
        record.inFlight = false;
        record.fetchedAt = SteadyClock::now();
        record.label = label.value_or("");
    }

    if (label) {
        cache_->store(address, *label);
        spdlog::debug("UPnP device {} -> {}", address, *label);
    }
}

} // namespace lanscout::infra
