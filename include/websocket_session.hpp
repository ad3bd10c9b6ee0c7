#pragma once

#include "presence_registry.hpp"
#include "server_config.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <queue>
#include <string>
#include <variant>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace parley {

// One upgraded connection. Reads and writes run on the stream's strand.
// Inbound frames are handed to the frame handler one at a time; the next
// read starts only once the handler calls `resume`. `resume` holds the
// session, so it stays alive while the handler has it.
class WebSocketSession : public EventSink,
                         public std::enable_shared_from_this<WebSocketSession> {
public:
    using FrameHandler = std::function<void(std::string frame, std::function<void()> resume)>;
    using CloseHandler = std::function<void()>;

    WebSocketSession(beast::ssl_stream<beast::tcp_stream>&& stream, const ServerConfig& config);
    WebSocketSession(beast::tcp_stream&& stream, const ServerConfig& config);
    ~WebSocketSession() override;

    WebSocketSession(const WebSocketSession&) = delete;
    WebSocketSession& operator=(const WebSocketSession&) = delete;

    void accept(http::request<http::string_body>&& req,
                std::function<void(beast::error_code)> on_accept);

    void run();

    // EventSink: both are safe to call from any thread.
    void send_frame(Frame frame) override;
    void close() override;

    std::string remote_address() const { return remote_addr_; }
    net::any_io_executor get_executor();

    void set_frame_handler(FrameHandler handler) { on_frame_ = std::move(handler); }
    void set_close_handler(CloseHandler handler) { on_close_ = std::move(handler); }
    void set_conn_guard(std::shared_ptr<void> guard) { conn_guard_ = std::move(guard); }

private:
    std::variant<
        websocket::stream<beast::ssl_stream<beast::tcp_stream>>,
        websocket::stream<beast::tcp_stream>
    > ws_;

    const ServerConfig& config_;
    std::string remote_addr_;

    beast::flat_buffer read_buffer_;
    std::queue<Frame> write_queue_;
    bool is_writing_ = false;
    bool running_ = false;
    bool closing_ = false;
    bool close_pending_ = false;
    std::atomic<bool> close_triggered_{false};

    FrameHandler on_frame_;
    CloseHandler on_close_;
    std::shared_ptr<void> conn_guard_;

    template <class Stream>
    void configure(websocket::stream<Stream>& ws);

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);

    void do_close();
    void start_close();
    void trigger_close_handler();
};

}
