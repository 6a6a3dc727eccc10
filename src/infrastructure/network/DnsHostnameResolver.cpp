#include "infrastructure/network/DnsHostnameResolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace lanscout::infra {

std::optional<std::string> DnsHostnameResolver::resolveHostname(const std::string& address) {
    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return std::nullopt;
    }

    char host[NI_MAXHOST];
    int rc = getnameinfo(reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr), host,
                         sizeof(host), nullptr, 0, NI_NAMEREQD);
    if (rc != 0) {
        spdlog::debug("Reverse lookup for {} failed: {}", address, gai_strerror(rc));
        return std::nullopt;
    }

    return formatHostname(host, address);
}

std::optional<std::string> DnsHostnameResolver::formatHostname(const std::string& fqdn,
                                                               const std::string& address) {
    std::string name = fqdn;
    while (!name.empty() && name.back() == '.') {
        name.pop_back();
    }
    if (name.empty() || name == address) {
        return std::nullopt;
    }

    auto toUpper = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    };

    auto firstDot = name.find('.');
    if (firstDot == std::string::npos) {
        return toUpper(name);
    }

    auto computer = toUpper(name.substr(0, firstDot));
    auto rest = name.substr(firstDot + 1);
    auto domain = rest.substr(0, rest.find('.'));

    if (domain.size() > 2) {
        return computer + " (" + domain + ")";
    }
    return computer;
}

} // namespace lanscout::infra
