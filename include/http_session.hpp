#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/strand.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <string>
#include <variant>

#include "server_config.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace parley {

class Store;
class PresenceRegistry;
class StoreExecutor;

// Reads one HTTP request and upgrades it to a WebSocket on the configured
// path. Every other request gets a 404.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(beast::ssl_stream<beast::tcp_stream>&& stream,
                const ServerConfig& config,
                Store& store,
                PresenceRegistry& presence,
                StoreExecutor& executor,
                std::shared_ptr<void> conn_guard);

    HttpSession(beast::tcp_stream&& stream,
                const ServerConfig& config,
                Store& store,
                PresenceRegistry& presence,
                StoreExecutor& executor,
                std::shared_ptr<void> conn_guard);

    void run();

private:
    std::variant<
        beast::ssl_stream<beast::tcp_stream>,
        beast::tcp_stream
    > stream_;
    bool is_tls_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    const ServerConfig& config_;
    Store& store_;
    PresenceRegistry& presence_;
    StoreExecutor& executor_;

    std::string remote_addr_;
    std::shared_ptr<void> conn_guard_;

    void on_handshake(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void handle_request();
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);

    void upgrade_to_websocket();

    http::response<http::string_body> handle_not_found();
};

}
