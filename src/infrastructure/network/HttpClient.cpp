#include "infrastructure/network/HttpClient.hpp"

#include "infrastructure/network/IpRange.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <future>
#include <sstream>

namespace lanscout::infra {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string decodeChunked(const std::string& body) {
    std::string decoded;
    size_t pos = 0;

    while (pos < body.size()) {
        auto lineEnd = body.find("\r\n", pos);
        if (lineEnd == std::string::npos) {
            break;
        }

        size_t chunkSize = 0;
        try {
            chunkSize = std::stoul(body.substr(pos, lineEnd - pos), nullptr, 16);
        } catch (const std::exception&) {
            break;
        }
        if (chunkSize == 0) {
            break;
        }

        pos = lineEnd + 2;
        decoded.append(body, pos, std::min(chunkSize, body.size() - pos));
        pos += chunkSize + 2;
    }

    return decoded;
}

} // namespace

std::optional<HttpUrl> HttpUrl::parse(const std::string& url) {
    const std::string scheme = "http://";
    if (url.size() <= scheme.size() || toLower(url.substr(0, scheme.size())) != scheme) {
        return std::nullopt;
    }

    HttpUrl result;
    auto rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    auto authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    result.path = slash == std::string::npos ? "/" : rest.substr(slash);

    auto colon = authority.find(':');
    if (colon != std::string::npos) {
        try {
            auto port = std::stoul(authority.substr(colon + 1));
            if (port == 0 || port > 65535) {
                return std::nullopt;
            }
            result.port = static_cast<uint16_t>(port);
        } catch (const std::exception&) {
            return std::nullopt;
        }
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return std::nullopt;
    }
    result.host = authority;
    return result;
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

HttpResponse HttpResponse::parse(const std::string& raw) {
    HttpResponse response;

    auto headerEnd = raw.find("\r\n\r\n");
    auto head = headerEnd == std::string::npos ? raw : raw.substr(0, headerEnd);

    std::istringstream stream(head);
    std::string line;
    if (!std::getline(stream, line) || line.rfind("HTTP/", 0) != 0) {
        response.errorMessage = "Malformed status line";
        return response;
    }

    std::istringstream statusLine(line);
    std::string version;
    statusLine >> version >> response.statusCode;
    if (response.statusCode == 0) {
        response.errorMessage = "Malformed status code";
        return response;
    }

    while (std::getline(stream, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        response.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    if (headerEnd != std::string::npos) {
        response.body = raw.substr(headerEnd + 4);
    }

    auto encoding = response.header("transfer-encoding");
    if (encoding && toLower(*encoding).find("chunked") != std::string::npos) {
        response.body = decodeChunked(response.body);
    } else if (auto length = response.header("content-length")) {
        try {
            auto expected = std::stoul(*length);
            if (response.body.size() > expected) {
                response.body.resize(expected);
            }
        } catch (const std::exception&) {
            spdlog::debug("Ignoring invalid Content-Length '{}'", *length);
        }
    }

    response.success = true;
    return response;
}

HttpClient::HttpClient(TcpProbe& probe) : probe_(probe) {}

std::string HttpClient::buildRequest(const HttpUrl& url) {
    std::string request = "GET " + url.path + " HTTP/1.1\r\n";
    request += "Host: " + url.host + ":" + std::to_string(url.port) + "\r\n";
    request += "User-Agent: LanScout/1.0 UPnP/1.0\r\n";
    request += "Accept: text/xml, application/xml, */*\r\n";
    request += "Connection: close\r\n\r\n";
    return request;
}

TcpProbe::CancelHandle HttpClient::getAsync(const std::string& url,
                                            std::chrono::milliseconds timeout,
                                            ResponseCallback callback) {
    auto parsed = HttpUrl::parse(url);
    if (!parsed || !IpRangeEnumerator::isValidIpv4(parsed->host)) {
        HttpResponse response;
        response.errorMessage = "Unsupported URL: " + url;
        callback(std::move(response));
        return [] {};
    }

    TcpRequest request;
    request.address = parsed->host;
    request.port = parsed->port;
    request.payload = buildRequest(*parsed);
    request.maxResponseBytes = MAX_RESPONSE_BYTES;
    request.readUntilEof = true;
    request.timeout = timeout;

    return probe_.exchangeAsync(request, [callback = std::move(callback)](TcpExchangeResult result) {
        if (result.response.empty()) {
            HttpResponse response;
            response.errorMessage = result.errorMessage.empty() ? "Empty response"
                                                                : result.errorMessage;
            callback(std::move(response));
            return;
        }
        callback(HttpResponse::parse(result.response));
    });
}

HttpResponse HttpClient::get(const std::string& url, std::chrono::milliseconds timeout,
                             std::stop_token stopToken) {
    auto promise = std::make_shared<std::promise<HttpResponse>>();
    auto future = promise->get_future();

    auto cancel = getAsync(url, timeout, [promise](HttpResponse response) {
        promise->set_value(std::move(response));
    });

    std::stop_callback onStop(stopToken, cancel);
    return future.get();
}

} // namespace lanscout::infra
