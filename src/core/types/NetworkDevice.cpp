#include "core/types/NetworkDevice.hpp"

namespace lanscout::core {

std::string NetworkDevice::displayType() const {
    return type.empty() ? "Unknown" : type;
}

std::string NetworkDevice::placeholderName(const std::string& address) {
    auto pos = address.rfind('.');
    if (pos == std::string::npos || pos + 1 >= address.size()) {
        return "DEVICE_" + address;
    }
    return "DEVICE_" + address.substr(pos + 1);
}

} // namespace lanscout::core
