/**
 * @file HttpClient.hpp
 * @brief Minimal HTTP/1.1 GET client for device description documents.
 */

#pragma once

#include "infrastructure/network/TcpProbe.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace lanscout::infra {

/**
 * @brief Components of an "http://host[:port]/path" URL.
 */
struct HttpUrl {
    std::string host;
    uint16_t port{80};
    std::string path{"/"};

    /**
     * @brief Parses an http URL. Other schemes are rejected.
     */
    static std::optional<HttpUrl> parse(const std::string& url);
};

/**
 * @brief Parsed HTTP response.
 */
struct HttpResponse {
    bool success{false};       ///< A status line was received
    int statusCode{0};
    std::map<std::string, std::string> headers; ///< Keys lower-cased
    std::string body;          ///< De-chunked when Transfer-Encoding is chunked
    std::string errorMessage;

    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;

    /**
     * @brief Parses a raw response buffer.
     */
    static HttpResponse parse(const std::string& raw);
};

/**
 * @brief Issues one GET per call over a fresh connection ("Connection: close").
 *
 * Only literal IPv4 hosts are supported.
 */
class HttpClient {
public:
    using ResponseCallback = std::function<void(HttpResponse)>;

    static constexpr size_t MAX_RESPONSE_BYTES = 256 * 1024;

    explicit HttpClient(TcpProbe& probe);

    /**
     * @brief Starts a GET and returns immediately.
     * @param callback Invoked once, on an I/O thread unless the URL is rejected
     *        up front. Must not block.
     * @return Handle that abandons the request when invoked.
     */
    TcpProbe::CancelHandle getAsync(const std::string& url, std::chrono::milliseconds timeout,
                                    ResponseCallback callback);

    /**
     * @brief Performs a GET and waits for the response.
     * @note Blocks; never call from an I/O thread.
     */
    HttpResponse get(const std::string& url, std::chrono::milliseconds timeout,
                     std::stop_token stopToken = {});

private:
    static std::string buildRequest(const HttpUrl& url);

    TcpProbe& probe_;
};

} // namespace lanscout::infra
