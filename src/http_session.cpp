#include "http_session.hpp"
#include "chat_session.hpp"
#include "event_logger.hpp"
#include "presence_registry.hpp"
#include "store.hpp"
#include "store_executor.hpp"
#include "websocket_session.hpp"
#include <boost/json.hpp>

namespace json = boost::json;

namespace parley {

namespace {

template <class Stream>
std::string peer_address(Stream& s) {
    beast::error_code ec;
    auto ep = beast::get_lowest_layer(s).socket().remote_endpoint(ec);
    return ec ? std::string("unknown") : ep.address().to_string();
}

}

HttpSession::HttpSession(beast::ssl_stream<beast::tcp_stream>&& stream,
                         const ServerConfig& config,
                         Store& store,
                         PresenceRegistry& presence,
                         StoreExecutor& executor,
                         std::shared_ptr<void> conn_guard)
    : stream_(std::move(stream))
    , is_tls_(true)
    , config_(config)
    , store_(store)
    , presence_(presence)
    , executor_(executor)
    , conn_guard_(std::move(conn_guard))
{
    remote_addr_ = peer_address(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_));
}

HttpSession::HttpSession(beast::tcp_stream&& stream,
                         const ServerConfig& config,
                         Store& store,
                         PresenceRegistry& presence,
                         StoreExecutor& executor,
                         std::shared_ptr<void> conn_guard)
    : stream_(std::move(stream))
    , is_tls_(false)
    , config_(config)
    , store_(store)
    , presence_(presence)
    , executor_(executor)
    , conn_guard_(std::move(conn_guard))
{
    remote_addr_ = peer_address(std::get<beast::tcp_stream>(stream_));
}

void HttpSession::run() {
    if (is_tls_) {
        auto self = shared_from_this();
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    } else {
        do_read();
    }
}

void HttpSession::on_handshake(beast::error_code ec) {
    if (ec) {
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::CONNECTION_REJECTED,
                         remote_addr_, "TLS handshake failed: " + ec.message());
        return;
    }
    do_read();
}

void HttpSession::do_read() {
    req_ = {};
    std::visit([this](auto& s) {
        beast::get_lowest_layer(s).expires_after(std::chrono::seconds(config_.handshake_timeout_sec));
    }, stream_);

    parser_.emplace();
    parser_->body_limit(config_.max_message_size);

    auto self = shared_from_this();
    std::visit([&](auto& s) {
        http::async_read(s, buffer_, *parser_, [self](beast::error_code ec, std::size_t bytes) {
            self->on_read(ec, bytes);
        });
    }, stream_);
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        return;
    }

    req_ = parser_->release();
    handle_request();
}

void HttpSession::handle_request() {
    std::string path(req_.target().data(), req_.target().size());
    auto query = path.find('?');
    if (query != std::string::npos) path.resize(query);

    if (websocket::is_upgrade(req_) && path == config_.websocket_path) {
        upgrade_to_websocket();
        return;
    }

    send_response(handle_not_found());
}

http::response<http::string_body> HttpSession::handle_not_found() {
    json::object response;
    response["error"] = "Not Found";

    http::response<http::string_body> res{http::status::not_found, req_.version()};
    res.set(http::field::server, "Parley");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req_.keep_alive());
    res.body() = json::serialize(response);
    res.prepare_payload();
    return res;
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

    auto self = shared_from_this();
    std::visit([&](auto& s) {
        http::async_write(s, *sp, [self, sp](beast::error_code ec, std::size_t bytes) {
            self->on_write(sp->need_eof(), ec, bytes);
        });
    }, stream_);
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::REQUEST_FAILED,
                         remote_addr_, "HTTP write failed: " + ec.message());
        return;
    }

    if (close) {
        std::visit([&ec](auto& s) {
            beast::get_lowest_layer(s).socket().shutdown(tcp::socket::shutdown_send, ec);
        }, stream_);
        return;
    }

    do_read();
}

// Hands the stream over to a WebSocketSession and attaches a ChatSession to it.
void HttpSession::upgrade_to_websocket() {
    std::shared_ptr<WebSocketSession> ws_session;
    if (is_tls_) {
        ws_session = std::make_shared<WebSocketSession>(
            std::move(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)), config_);
    } else {
        ws_session = std::make_shared<WebSocketSession>(
            std::move(std::get<beast::tcp_stream>(stream_)), config_);
    }

    ws_session->set_conn_guard(std::move(conn_guard_));

    auto chat = std::make_shared<ChatSession>(
        config_, store_, presence_, executor_,
        std::weak_ptr<EventSink>(ws_session),
        ws_session->get_executor(),
        ws_session->remote_address());

    std::weak_ptr<WebSocketSession> weak_ws = ws_session;
    ws_session->set_frame_handler(
        [chat, weak_ws](std::string frame, std::function<void()> resume) {
            chat->handle_frame(std::move(frame), [weak_ws, resume](bool ok) {
                if (ok) {
                    resume();
                } else if (auto ws = weak_ws.lock()) {
                    ws->close();
                }
            });
        });
    ws_session->set_close_handler([chat]() {
        chat->close();
    });

    parser_.reset();

    ws_session->accept(
        std::move(req_),
        [ws_session](beast::error_code ec) {
            if (ec) {
                EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::CONNECTION_REJECTED,
                                 ws_session->remote_address(), "WebSocket accept failed: " + ec.message());
                return;
            }
            ws_session->run();
        });
}

}
