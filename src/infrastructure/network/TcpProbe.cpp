#include "infrastructure/network/TcpProbe.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <future>
#include <memory>
#include <vector>

namespace lanscout::infra {

namespace {

struct ExchangeState {
    explicit ExchangeState(asio::io_context& io)
        : strand(asio::make_strand(io)), socket(strand), timer(strand) {}

    asio::strand<asio::io_context::executor_type> strand;
    asio::ip::tcp::socket socket;
    asio::steady_timer timer;
    std::atomic<bool> completed{false};
    TcpRequest request;
    TcpExchangeResult result;
    std::vector<char> buffer;
    TcpProbe::ExchangeCallback callback;
};

void finish(const std::shared_ptr<ExchangeState>& state, bool success, std::string error) {
    if (state->completed.exchange(true)) {
        return;
    }

    state->timer.cancel();
    asio::error_code ignored;
    state->socket.close(ignored);

    state->result.success = success;
    state->result.errorMessage = std::move(error);

    if (state->callback) {
        state->callback(std::move(state->result));
    }
}

void readResponse(const std::shared_ptr<ExchangeState>& state) {
    auto& request = state->request;
    size_t received = state->result.response.size();
    if (received >= request.maxResponseBytes) {
        finish(state, true, {});
        return;
    }

    state->buffer.resize(request.maxResponseBytes - received);
    state->socket.async_read_some(
        asio::buffer(state->buffer),
        [state](const asio::error_code& ec, size_t bytes) {
            if (state->completed) {
                return;
            }

            state->result.response.append(state->buffer.data(), bytes);

            if (ec == asio::error::eof) {
                finish(state, true, {});
                return;
            }
            if (ec) {
                // A partial response is still useful to banner matchers
                finish(state, !state->result.response.empty(), ec.message());
                return;
            }

            if (state->request.readUntilEof) {
                readResponse(state);
            } else {
                finish(state, true, {});
            }
        });
}

void afterConnect(const std::shared_ptr<ExchangeState>& state) {
    if (state->request.payload.empty()) {
        if (state->request.maxResponseBytes == 0) {
            finish(state, true, {});
        } else {
            readResponse(state);
        }
        return;
    }

    asio::async_write(state->socket, asio::buffer(state->request.payload),
                      [state](const asio::error_code& ec, size_t) {
                          if (state->completed) {
                              return;
                          }
                          if (ec) {
                              finish(state, false, "Write failed: " + ec.message());
                              return;
                          }
                          if (state->request.maxResponseBytes == 0) {
                              finish(state, true, {});
                          } else {
                              readResponse(state);
                          }
                      });
}

} // namespace

TcpProbe::TcpProbe(AsioContext& context) : context_(context) {}

TcpProbe::CancelHandle TcpProbe::exchangeAsync(const TcpRequest& request,
                                               ExchangeCallback callback) {
    auto state = std::make_shared<ExchangeState>(context_.ioContext());
    state->request = request;
    state->callback = std::move(callback);

    asio::error_code ec;
    auto address = asio::ip::make_address_v4(request.address, ec);
    if (ec) {
        finish(state, false, "Invalid address: " + request.address);
        return [] {};
    }
    asio::ip::tcp::endpoint endpoint(address, request.port);

    asio::dispatch(state->strand, [state, endpoint]() {
        state->timer.expires_after(state->request.timeout);
        state->timer.async_wait([state](const asio::error_code& timerEc) {
            if (timerEc) {
                return; // Timer cancelled
            }
            finish(state, false, "Timeout");
        });

        state->socket.async_connect(endpoint, [state](const asio::error_code& connectEc) {
            if (state->completed) {
                return;
            }
            if (connectEc) {
                finish(state, false, "Connect failed: " + connectEc.message());
                return;
            }
            state->result.connected = true;
            afterConnect(state);
        });
    });

    return [state]() {
        asio::post(state->strand, [state]() { finish(state, false, "Cancelled"); });
    };
}

TcpExchangeResult TcpProbe::exchange(const TcpRequest& request, std::stop_token stopToken) {
    if (stopToken.stop_requested()) {
        TcpExchangeResult result;
        result.errorMessage = "Cancelled";
        return result;
    }

    auto promise = std::make_shared<std::promise<TcpExchangeResult>>();
    auto future = promise->get_future();

    auto cancel = exchangeAsync(request, [promise](TcpExchangeResult result) {
        promise->set_value(std::move(result));
    });

    std::stop_callback onStop(stopToken, cancel);
    auto result = future.get();

    spdlog::trace("TCP {}:{} connected={} bytes={} {}", request.address, request.port,
                  result.connected, result.response.size(), result.errorMessage);
    return result;
}

bool TcpProbe::isPortOpen(const std::string& address, uint16_t port,
                          std::chrono::milliseconds timeout, std::stop_token stopToken) {
    TcpRequest request;
    request.address = address;
    request.port = port;
    request.timeout = timeout;
    return exchange(request, stopToken).connected;
}

} // namespace lanscout::infra
