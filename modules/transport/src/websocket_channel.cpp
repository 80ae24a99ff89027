#include "websocket_channel.h"
#include "logger.h"
#include "string_utils.h"
#include "tvlink_error.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace tvlink {

std::string Endpoint::url() const {
    return std::string(secure ? "wss" : "ws") + "://" + host + ":" + std::to_string(port) + path;
}

std::optional<Endpoint> parse_socket_url(const std::string& url) {
    const std::string trimmed = trim(url);
    const auto scheme_end = trimmed.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }

    Endpoint endpoint;
    const std::string scheme = to_lower(trimmed.substr(0, scheme_end));
    if (scheme == "wss") {
        endpoint.secure = true;
        endpoint.port = 3001;
    } else if (scheme == "ws") {
        endpoint.secure = false;
        endpoint.port = 3000;
    } else {
        return std::nullopt;
    }

    std::string rest = trimmed.substr(scheme_end + 3);
    const auto path_start = rest.find('/');
    if (path_start != std::string::npos) {
        endpoint.path = rest.substr(path_start);
        rest = rest.substr(0, path_start);
    }

    const auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        const std::string port_text = rest.substr(colon + 1);
        rest = rest.substr(0, colon);
        try {
            size_t used = 0;
            const int port = std::stoi(port_text, &used);
            if (used != port_text.size() || port <= 0 || port > 65535) {
                return std::nullopt;
            }
            endpoint.port = port;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    if (rest.empty()) {
        return std::nullopt;
    }
    endpoint.host = rest;
    return endpoint;
}

namespace {

using Completion = std::function<void(beast::error_code)>;

constexpr auto kWriteTimeout = std::chrono::seconds(5);
constexpr auto kCloseWait = std::chrono::milliseconds(1200);

class SessionBase {
public:
    virtual ~SessionBase() = default;

    virtual void run(tcp::resolver::results_type results,
                     const Endpoint& endpoint,
                     std::chrono::milliseconds timeout,
                     Completion done) = 0;
    virtual void send(std::string text, Completion done) = 0;
    virtual void send_ping(Completion done) = 0;
    virtual void shutdown(Completion done) = 0;

    FrameChannel::FrameHandler on_frame;
    FrameChannel::CloseHandler on_close;
    std::function<void()> on_pong;
    std::atomic<bool> closing{false};
};

template <class NextLayer>
class WsSession : public SessionBase, public std::enable_shared_from_this<WsSession<NextLayer>> {
public:
    template <class... Args>
    explicit WsSession(Args&&... args) : ws_(std::forward<Args>(args)...) {}

    void run(tcp::resolver::results_type results,
             const Endpoint& endpoint,
             std::chrono::milliseconds timeout,
             Completion done) override {
        auto self = this->shared_from_this();
        net::post(ws_.get_executor(), [self, results, endpoint, timeout, done = std::move(done)]() mutable {
            self->endpoint_ = endpoint;
            self->open_done_ = std::move(done);
            beast::get_lowest_layer(self->ws_).expires_after(timeout);
            beast::get_lowest_layer(self->ws_).async_connect(
                results,
                [self](beast::error_code ec, const tcp::endpoint&) { self->on_connect(ec); });
        });
    }

    void send(std::string text, Completion done) override {
        auto self = this->shared_from_this();
        net::post(ws_.get_executor(), [self, text = std::move(text), done = std::move(done)]() mutable {
            if (self->closing.load()) {
                if (done) done(net::error::not_connected);
                return;
            }
            self->write_queue_.emplace_back(std::move(text), std::move(done));
            if (self->write_queue_.size() == 1) {
                self->do_write();
            }
        });
    }

    void send_ping(Completion done) override {
        auto self = this->shared_from_this();
        net::post(ws_.get_executor(), [self, done = std::move(done)]() {
            if (self->ping_in_flight_ || self->closing.load()) {
                done(net::error::in_progress);
                return;
            }
            self->ping_in_flight_ = true;
            self->ws_.async_ping({}, [self, done](beast::error_code ec) {
                self->ping_in_flight_ = false;
                done(ec);
            });
        });
    }

    void shutdown(Completion done) override {
        auto self = this->shared_from_this();
        net::post(ws_.get_executor(), [self, done = std::move(done)]() {
            self->closing.store(true);
            self->fail_writes(net::error::operation_aborted);
            if (!self->ws_.is_open()) {
                beast::error_code ignored;
                beast::get_lowest_layer(self->ws_).socket().close(ignored);
                if (done) done({});
                return;
            }
            self->ws_.async_close(websocket::close_code::normal, [self, done](beast::error_code ec) {
                if (done) done(ec);
            });
        });
    }

private:
    void on_connect(beast::error_code ec) {
        if (ec) {
            finish_open(ec);
            return;
        }
        if constexpr (std::is_same<NextLayer, beast::tcp_stream>::value) {
            start_handshake();
        } else {
            if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), endpoint_.host.c_str())) {
                finish_open(beast::error_code(static_cast<int>(::ERR_get_error()),
                                              net::error::get_ssl_category()));
                return;
            }
            auto self = this->shared_from_this();
            ws_.next_layer().async_handshake(ssl::stream_base::client, [self](beast::error_code tls_ec) {
                if (tls_ec) {
                    self->finish_open(tls_ec);
                    return;
                }
                self->start_handshake();
            });
        }
    }

    void start_handshake() {
        ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(http::field::user_agent, "tvlink/1.0");
        }));

        std::weak_ptr<WsSession> weak = this->shared_from_this();
        ws_.control_callback([weak](websocket::frame_type kind, beast::string_view) {
            if (kind != websocket::frame_type::pong) {
                return;
            }
            if (auto self = weak.lock()) {
                if (self->on_pong) self->on_pong();
            }
        });

        auto self = this->shared_from_this();
        const std::string host = endpoint_.host + ":" + std::to_string(endpoint_.port);
        ws_.async_handshake(host, endpoint_.path, [self](beast::error_code ec) {
            if (!ec) {
                beast::get_lowest_layer(self->ws_).expires_never();
                websocket::stream_base::timeout opt{
                    std::chrono::seconds(2),
                    websocket::stream_base::none(),
                    false};
                self->ws_.set_option(opt);
            }
            self->finish_open(ec);
            if (!ec) {
                self->do_read();
            }
        });
    }

    void finish_open(beast::error_code ec) {
        if (open_done_) {
            auto done = std::move(open_done_);
            open_done_ = nullptr;
            done(ec);
        }
    }

    void do_read() {
        auto self = this->shared_from_this();
        ws_.async_read(buffer_, [self](beast::error_code ec, std::size_t) {
            if (ec) {
                self->fail_writes(ec);
                if (!self->closing.exchange(true) && self->on_close) {
                    self->on_close(ec == websocket::error::closed
                                       ? std::string("Connection to the TV was lost.")
                                       : "Connection to the TV was lost: " + ec.message());
                }
                return;
            }
            std::string text = beast::buffers_to_string(self->buffer_.data());
            self->buffer_.consume(self->buffer_.size());
            if (!self->closing.load() && self->on_frame) {
                self->on_frame(text);
            }
            self->do_read();
        });
    }

    void do_write() {
        auto self = this->shared_from_this();
        ws_.text(true);
        ws_.async_write(net::buffer(write_queue_.front().first), [self](beast::error_code ec, std::size_t) {
            if (self->write_queue_.empty()) {
                return;
            }
            auto done = std::move(self->write_queue_.front().second);
            self->write_queue_.pop_front();
            if (done) done(ec);
            if (ec) {
                self->fail_writes(ec);
                return;
            }
            if (!self->write_queue_.empty()) {
                self->do_write();
            }
        });
    }

    void fail_writes(beast::error_code ec) {
        // The front entry is owned by an in-flight async_write when one is pending.
        while (write_queue_.size() > 1) {
            auto done = std::move(write_queue_.back().second);
            write_queue_.pop_back();
            if (done) done(ec);
        }
    }

    websocket::stream<NextLayer> ws_;
    beast::flat_buffer buffer_;
    Endpoint endpoint_;
    Completion open_done_;
    std::deque<std::pair<std::string, Completion>> write_queue_;
    bool ping_in_flight_ = false;
};

} // namespace

class WebSocketChannel::Impl {
public:
    Impl() : ssl_ctx(ssl::context::tlsv12_client) {
        // webOS TVs present self-signed certificates on 3001.
        ssl_ctx.set_verify_mode(ssl::verify_none);
    }

    bool on_io_thread() const {
        return io_thread.joinable() && std::this_thread::get_id() == io_thread.get_id();
    }

    void resolve_pong(bool value) {
        std::shared_ptr<std::promise<bool>> waiter;
        {
            std::lock_guard<std::mutex> lock(pong_mutex);
            waiter.swap(pong_waiter);
        }
        if (waiter) {
            waiter->set_value(value);
        }
    }

    ssl::context ssl_ctx;
    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> work;
    std::thread io_thread;
    std::shared_ptr<SessionBase> session;
    std::atomic<bool> opened{false};
    std::atomic<bool> closed{false};
    std::mutex close_mutex;

    std::mutex pong_mutex;
    std::shared_ptr<std::promise<bool>> pong_waiter;
};

WebSocketChannel::WebSocketChannel() : m_impl(std::make_shared<Impl>()) {}

WebSocketChannel::~WebSocketChannel() {
    close();
}

FrameChannelFactory WebSocketChannel::factory() {
    return [] { return std::make_unique<WebSocketChannel>(); };
}

void WebSocketChannel::open(const Endpoint& endpoint,
                            std::chrono::milliseconds timeout,
                            FrameHandler on_frame,
                            CloseHandler on_close) {
    auto impl = m_impl;
    if (impl->session || impl->closed) {
        throw TvLinkError(ErrorCode::NetworkFailure, "WebSocket channel cannot be reopened.");
    }
    if (trim(endpoint.host).empty()) {
        throw TvLinkError(ErrorCode::InvalidAddress);
    }

    tcp::resolver resolver(impl->ioc);
    beast::error_code resolve_ec;
    auto results = resolver.resolve(endpoint.host, std::to_string(endpoint.port), resolve_ec);
    if (resolve_ec || results.empty()) {
        LOG_WARN("[Transport] Cannot resolve " + endpoint.host + ": " + resolve_ec.message());
        throw TvLinkError(ErrorCode::InvalidAddress, resolve_ec.message());
    }

    std::shared_ptr<SessionBase> session;
    if (endpoint.secure) {
        session = std::make_shared<WsSession<beast::ssl_stream<beast::tcp_stream>>>(
            net::make_strand(impl->ioc), impl->ssl_ctx);
    } else {
        session = std::make_shared<WsSession<beast::tcp_stream>>(net::make_strand(impl->ioc));
    }

    std::weak_ptr<Impl> weak = impl;
    session->on_frame = std::move(on_frame);
    session->on_pong = [weak] {
        if (auto i = weak.lock()) i->resolve_pong(true);
    };
    session->on_close = [weak, on_close = std::move(on_close)](const std::string& reason) {
        if (auto i = weak.lock()) i->resolve_pong(false);
        LOG_DEBUG("[Transport] WebSocket closed by peer: " + reason);
        if (on_close) on_close(reason);
    };

    impl->session = session;
    impl->work = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
        impl->ioc.get_executor());
    impl->io_thread = std::thread([impl] {
        try {
            impl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("[Transport] io_context failure: " + std::string(e.what()));
        }
    });

    auto done = std::make_shared<std::promise<beast::error_code>>();
    auto fut = done->get_future();
    session->run(results, endpoint, timeout, [done](beast::error_code ec) { done->set_value(ec); });

    const std::string target = endpoint.host + ":" + std::to_string(endpoint.port);
    if (fut.wait_for(timeout + std::chrono::milliseconds(500)) != std::future_status::ready) {
        close();
        throw TvLinkError(ErrorCode::NetworkFailure, "Connection to " + target + " timed out.");
    }
    const beast::error_code ec = fut.get();
    if (ec) {
        close();
        if (ec == beast::error::timeout) {
            throw TvLinkError(ErrorCode::NetworkFailure, "Connection to " + target + " timed out.");
        }
        throw TvLinkError(ErrorCode::NetworkFailure, "Could not connect to " + target + ": " + ec.message());
    }

    impl->opened = true;
    LOG_DEBUG("[Transport] WebSocket open " + endpoint.url());
}

void WebSocketChannel::send_text(const std::string& text) {
    auto impl = m_impl;
    auto session = impl->session;
    if (!session || !is_open()) {
        throw TvLinkError(ErrorCode::NotConnected);
    }

    if (impl->on_io_thread()) {
        session->send(text, nullptr);
        return;
    }

    auto done = std::make_shared<std::promise<beast::error_code>>();
    auto fut = done->get_future();
    session->send(text, [done](beast::error_code ec) { done->set_value(ec); });

    const auto deadline = std::chrono::steady_clock::now() + kWriteTimeout;
    while (fut.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (impl->closed) {
            throw TvLinkError(ErrorCode::NotConnected);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            throw TvLinkError(ErrorCode::NetworkFailure, "Socket write timed out.");
        }
    }
    const beast::error_code ec = fut.get();
    if (ec == net::error::not_connected || ec == net::error::operation_aborted) {
        throw TvLinkError(ErrorCode::NotConnected);
    }
    if (ec) {
        throw TvLinkError(ErrorCode::NetworkFailure, "Network failure: " + ec.message());
    }
}

bool WebSocketChannel::ping(std::chrono::milliseconds timeout) {
    auto impl = m_impl;
    auto session = impl->session;
    if (!session || !is_open() || impl->on_io_thread()) {
        return false;
    }

    auto waiter = std::make_shared<std::promise<bool>>();
    auto fut = waiter->get_future();
    std::shared_ptr<std::promise<bool>> previous;
    {
        std::lock_guard<std::mutex> lock(impl->pong_mutex);
        previous = impl->pong_waiter;
        impl->pong_waiter = waiter;
    }
    if (previous) {
        previous->set_value(false);
    }

    std::weak_ptr<Impl> weak = impl;
    session->send_ping([weak, waiter](beast::error_code ec) {
        if (!ec) return;
        if (auto i = weak.lock()) {
            std::lock_guard<std::mutex> lock(i->pong_mutex);
            if (i->pong_waiter != waiter) return;
            i->pong_waiter.reset();
        }
        waiter->set_value(false);
    });

    if (fut.wait_for(timeout) == std::future_status::ready) {
        return fut.get();
    }
    {
        std::lock_guard<std::mutex> lock(impl->pong_mutex);
        if (impl->pong_waiter == waiter) {
            impl->pong_waiter.reset();
        }
    }
    return false;
}

void WebSocketChannel::close() {
    auto impl = m_impl;
    std::lock_guard<std::mutex> lock(impl->close_mutex);
    if (impl->closed.exchange(true)) {
        return;
    }
    impl->opened = false;
    impl->resolve_pong(false);

    if (auto session = impl->session) {
        session->closing = true;
        if (impl->on_io_thread()) {
            session->shutdown(nullptr);
        } else if (impl->io_thread.joinable()) {
            auto done = std::make_shared<std::promise<void>>();
            auto fut = done->get_future();
            session->shutdown([done](beast::error_code) { done->set_value(); });
            fut.wait_for(kCloseWait);
        }
    }

    impl->work.reset();
    impl->ioc.stop();
    if (impl->io_thread.joinable()) {
        if (impl->on_io_thread()) {
            impl->io_thread.detach();
        } else {
            impl->io_thread.join();
        }
    }
}

bool WebSocketChannel::is_open() const {
    auto session = m_impl->session;
    return m_impl->opened && !m_impl->closed && session && !session->closing;
}

} // namespace tvlink
