#include "network/BinanceTradeStreamClient.h"

#include "common/Logger.h"
#include "network/TradeMessageParser.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

namespace {
long long nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}
}

namespace quantpulse {
namespace network {

std::string toString(FeedState state) {
    switch (state) {
        case FeedState::DISCONNECTED: return "disconnected";
        case FeedState::CONNECTING: return "connecting";
        case FeedState::CONNECTED: return "connected";
        case FeedState::LISTENING: return "listening";
        case FeedState::RECONNECTING: return "reconnecting";
        case FeedState::FAILED: return "failed";
        case FeedState::CLOSED: return "closed";
    }
    return "disconnected";
}

BinanceTradeStreamClient::BinanceTradeStreamClient(FeedConfig config, feed::TradeChannel& channel)
    : config_(std::move(config))
    , channel_(channel)
    , backoff_(config_.backoff_base_seconds, config_.backoff_max_seconds, config_.max_reconnect_attempts) {}

BinanceTradeStreamClient::~BinanceTradeStreamClient() {
    stop();
}

bool BinanceTradeStreamClient::start() {
    if (running_.load()) {
        return false;
    }
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    backoff_.reset();
    reconnect_attempts_ = 0;
    running_ = true;
    worker_thread_ = std::thread(&BinanceTradeStreamClient::run, this);
    return true;
}

void BinanceTradeStreamClient::stop() {
    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        was_running = running_.exchange(false);
    }
    sleep_cv_.notify_all();
    shutdownActiveSocket();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    if (was_running && state_.load() != FeedState::FAILED) {
        setState(FeedState::CLOSED);
    }
}

void BinanceTradeStreamClient::setStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    state_listener_ = std::move(listener);
}

void BinanceTradeStreamClient::setState(FeedState state) {
    const FeedState previous = state_.exchange(state);
    if (previous == state) {
        return;
    }

    StateListener listener_copy;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener_copy = state_listener_;
    }
    if (listener_copy) {
        listener_copy(state);
    }
}

bool BinanceTradeStreamClient::isConnected() const {
    const auto state = state_.load();
    return state == FeedState::CONNECTED || state == FeedState::LISTENING;
}

double BinanceTradeStreamClient::getUptimeSeconds() const {
    const long long since = connected_at_ms_.load();
    if (since == 0) {
        return 0.0;
    }
    return static_cast<double>(nowMs() - since) / 1000.0;
}

FeedStatus BinanceTradeStreamClient::getStatus() const {
    FeedStatus status;
    status.state = state_.load();
    status.uptime_seconds = getUptimeSeconds();
    status.ticks_received = ticks_received_.load();
    status.last_tick_timestamp = last_tick_timestamp_.load();
    status.reconnect_attempts = reconnect_attempts_.load();
    status.parse_failures = parse_failures_.load();
    status.dropped_events = channel_.droppedCount();
    return status;
}

std::string BinanceTradeStreamClient::buildTarget() const {
    std::string target = config_.path_prefix;
    for (size_t i = 0; i < config_.instruments.size(); ++i) {
        if (i > 0) {
            target += "/";
        }
        target += TradeMessageParser::streamName(config_.instruments[i], config_.stream_suffix);
    }
    return target;
}

void BinanceTradeStreamClient::connect() {
    if (running_.exchange(true)) {
        LOG_WARN("Trade stream already running");
        return;
    }
    backoff_.reset();
    reconnect_attempts_ = 0;
    run();
}

void BinanceTradeStreamClient::run() {
    while (running_.load()) {
        setState(FeedState::CONNECTING);
        try {
            connectAndReadLoop();
        } catch (const std::exception& e) {
            if (!running_.load()) {
                break;
            }
            LOG_WARN("Trade stream disconnected: {}", e.what());
        }

        if (!running_.load()) {
            break;
        }

        setState(FeedState::RECONNECTING);
        const auto wait_seconds = backoff_.onFailure();
        reconnect_attempts_ = backoff_.attempts();
        if (!wait_seconds) {
            LOG_ERROR("Trade stream giving up after {} attempts", backoff_.attempts());
            running_ = false;
            setState(FeedState::FAILED);
            return;
        }

        LOG_WARN("Reconnecting in {:.1f}s (attempt {}/{})",
                 *wait_seconds, backoff_.attempts(), backoff_.maxAttempts());
        if (!sleepInterruptible(*wait_seconds)) {
            break;
        }
    }

    setState(FeedState::CLOSED);
}

bool BinanceTradeStreamClient::sleepInterruptible(double seconds) {
    std::unique_lock<std::mutex> lock(sleep_mutex_);
    const auto wait = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
    sleep_cv_.wait_for(lock, wait, [this] { return !running_.load(); });
    return running_.load();
}

void BinanceTradeStreamClient::shutdownActiveSocket() {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (socket_shutdown_) {
        socket_shutdown_();
    }
}

void BinanceTradeStreamClient::connectAndReadLoop() {
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    namespace net = boost::asio;
    namespace ssl = boost::asio::ssl;
    using tcp = boost::asio::ip::tcp;

    net::io_context ioc;
    ssl::context ssl_ctx(ssl::context::tlsv12_client);
    ssl_ctx.set_default_verify_paths();
    ssl_ctx.set_verify_mode(ssl::verify_peer);

    websocket::stream<beast::ssl_stream<tcp::socket>> ws(ioc, ssl_ctx);
    ws.set_option(websocket::stream_base::timeout{
        std::chrono::seconds(config_.handshake_timeout_seconds),
        std::chrono::seconds(config_.idle_timeout_seconds),
        true
    });

    auto& raw_socket = ws.next_layer().next_layer();
    {
        std::lock_guard<std::mutex> lock(socket_mutex_);
        socket_shutdown_ = [&raw_socket]() {
            boost::system::error_code ec;
            raw_socket.shutdown(tcp::socket::shutdown_both, ec);
        };
    }
    struct ShutdownHookGuard {
        BinanceTradeStreamClient* self;
        ~ShutdownHookGuard() {
            std::lock_guard<std::mutex> lock(self->socket_mutex_);
            self->socket_shutdown_ = nullptr;
        }
    } hook_guard{this};

    if (!running_.load()) {
        return;
    }

    const std::string& host = config_.host;
    const std::string target = buildTarget();

    tcp::resolver resolver(ioc);
    auto results = resolver.resolve(host, config_.port);
    net::connect(raw_socket, results.begin(), results.end());
    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), host.c_str())) {
        throw std::runtime_error("Trade stream SNI setup failed");
    }
    ws.next_layer().set_verify_callback(ssl::host_name_verification(host));
    ws.next_layer().handshake(ssl::stream_base::client);

    ws.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(boost::beast::http::field::user_agent, "QuantPulse/1.0");
        }
    ));

    ws.handshake(host, target);

    backoff_.reset();
    reconnect_attempts_ = 0;
    connected_at_ms_ = nowMs();
    setState(FeedState::CONNECTED);
    LOG_INFO("Trade stream connected: {}{}", host, target);

    beast::flat_buffer buffer;
    setState(FeedState::LISTENING);

    while (running_.load()) {
        boost::system::error_code ec;
        ws.read(buffer, ec);
        if (!ec) {
            const std::string payload = beast::buffers_to_string(buffer.cdata());
            buffer.consume(buffer.size());
            handleMessage(payload);
        } else if (!running_.load()) {
            break;
        } else if (ec == beast::error::timeout) {
            throw std::runtime_error("trade stream timed out");
        } else if (ec == websocket::error::closed) {
            throw std::runtime_error("trade stream closed by server");
        } else {
            throw std::runtime_error("trade stream read failed: " + ec.message());
        }
    }

    boost::system::error_code close_ec;
    ws.close(websocket::close_code::normal, close_ec);
    if (close_ec && close_ec != websocket::error::closed) {
        LOG_WARN("Trade stream close warning: {}", close_ec.message());
    } else {
        LOG_INFO("Trade stream stopped");
    }
}

bool BinanceTradeStreamClient::handleMessage(const std::string& payload) {
    auto trade = TradeMessageParser::parse(payload, nowMs());
    if (!trade) {
        parse_failures_++;
        LOG_DEBUG("Dropped unrecognized stream message ({} bytes)", payload.size());
        return false;
    }

    ticks_received_++;
    last_tick_timestamp_ = trade->timestamp;
    if (!channel_.push(std::move(*trade))) {
        LOG_DEBUG("Trade channel full, oldest event dropped");
    }
    return true;
}

} // namespace network
} // namespace quantpulse
