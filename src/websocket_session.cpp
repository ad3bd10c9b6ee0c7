#include "websocket_session.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

namespace parley {

namespace {

template <class Stream>
std::string peer_address(Stream& ws) {
    beast::error_code ec;
    auto ep = beast::get_lowest_layer(ws).socket().remote_endpoint(ec);
    return ec ? std::string("unknown") : ep.address().to_string();
}

}

WebSocketSession::WebSocketSession(beast::ssl_stream<beast::tcp_stream>&& stream,
                                   const ServerConfig& config)
    : ws_(std::in_place_index<0>, std::move(stream))
    , config_(config)
{
    auto& ws = std::get<0>(ws_);
    remote_addr_ = peer_address(ws);
    configure(ws);
}

// Plaintext WebSocket (local development or behind a TLS-terminating proxy)
WebSocketSession::WebSocketSession(beast::tcp_stream&& stream, const ServerConfig& config)
    : ws_(std::in_place_index<1>, std::move(stream))
    , config_(config)
{
    auto& ws = std::get<1>(ws_);
    remote_addr_ = peer_address(ws);
    configure(ws);
}

WebSocketSession::~WebSocketSession() {
    trigger_close_handler();
}

template <class Stream>
void WebSocketSession::configure(websocket::stream<Stream>& ws) {
    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = std::chrono::seconds(config_.handshake_timeout_sec);
    opt.idle_timeout = std::chrono::seconds(config_.idle_timeout_sec);
    opt.keep_alive_pings = true;
    ws.set_option(opt);

    // The WebSocket layer owns timeouts from here on.
    beast::get_lowest_layer(ws).expires_never();

    ws.read_message_max(config_.max_message_size);
    ws.binary(true);
}

net::any_io_executor WebSocketSession::get_executor() {
    return std::visit([](auto& ws) -> net::any_io_executor { return ws.get_executor(); }, ws_);
}

void WebSocketSession::accept(http::request<http::string_body>&& req,
                              std::function<void(beast::error_code)> on_accept) {
    auto self = shared_from_this();
    std::visit([&](auto& ws) {
        ws.async_accept(req, [self, on_accept](beast::error_code ec) {
            if (on_accept) on_accept(ec);
        });
    }, ws_);
}

void WebSocketSession::run() {
    running_ = true;
    MetricsRegistry::instance().add(Gauge::SessionsActive, 1.0);
    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::SESSION_OPENED, remote_addr_);
    do_read();
}

void WebSocketSession::do_read() {
    if (closing_) return;
    auto self = shared_from_this();
    std::visit([&](auto& ws) {
        ws.async_read(read_buffer_, [self](beast::error_code ec, std::size_t bytes) {
            self->on_read(ec, bytes);
        });
    }, ws_);
}

void WebSocketSession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec == websocket::error::closed) {
        trigger_close_handler();
        return;
    }

    if (ec) {
        if (ec != net::error::operation_aborted) {
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::SESSION_CLOSED,
                             remote_addr_, "Read ended: " + ec.message());
        }
        trigger_close_handler();
        return;
    }

    // Text and binary frames are decoded the same way.
    std::string frame = beast::buffers_to_string(
        beast::buffers_prefix(bytes_transferred, read_buffer_.data()));
    read_buffer_.consume(bytes_transferred);

    if (!on_frame_) {
        do_read();
        return;
    }

    // No read is pending while the request runs, so `resume` owns the session
    // until the handler is done with it.
    auto self = shared_from_this();
    on_frame_(std::move(frame), [self]() {
        net::dispatch(self->get_executor(), [self]() { self->do_read(); });
    });
}

void WebSocketSession::send_frame(Frame frame) {
    if (!frame) return;
    net::post(get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
        if (self->closing_) return;
        self->write_queue_.push(std::move(frame));
        self->do_write();
    });
}

void WebSocketSession::do_write() {
    if (write_queue_.empty() || is_writing_ || closing_) {
        return;
    }

    is_writing_ = true;
    Frame item = write_queue_.front();
    write_queue_.pop();

    auto self = shared_from_this();
    std::visit([&](auto& ws) {
        ws.async_write(net::buffer(*item), [self, item](beast::error_code ec, std::size_t bytes) {
            self->on_write(ec, bytes);
        });
    }, ws_);
}

void WebSocketSession::on_write(beast::error_code ec, std::size_t) {
    is_writing_ = false;

    if (close_pending_) {
        close_pending_ = false;
        start_close();
        return;
    }

    if (ec) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::SESSION_CLOSED,
                         remote_addr_, "Write failed: " + ec.message());
        close();
        return;
    }

    do_write();
}

void WebSocketSession::close() {
    net::post(get_executor(), [self = shared_from_this()]() {
        self->do_close();
    });
}

void WebSocketSession::do_close() {
    if (closing_) return;
    closing_ = true;

    // async_close may not overlap a pending async_write.
    if (is_writing_) {
        close_pending_ = true;
        return;
    }
    start_close();
}

void WebSocketSession::start_close() {
    auto self = shared_from_this();
    std::visit([&](auto& ws) {
        ws.async_close(websocket::close_code::normal, [self](beast::error_code ec) {
            if (ec && ec != net::error::operation_aborted) {
                EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::SESSION_CLOSED,
                                 self->remote_addr_, "Close handshake failed: " + ec.message());
            }
            self->trigger_close_handler();
        });
    }, ws_);
}

void WebSocketSession::trigger_close_handler() {
    if (close_triggered_.exchange(true)) return;
    closing_ = true;

    if (running_) {
        MetricsRegistry::instance().add(Gauge::SessionsActive, -1.0);
    }
    if (on_close_) on_close_();

    on_frame_ = nullptr;
    on_close_ = nullptr;
}

}
