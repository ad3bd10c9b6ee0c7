#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <openssl/rand.h>

#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "server_config.hpp"
#include "store.hpp"
#include "store_executor.hpp"
#include "presence_registry.hpp"
#include "http_session.hpp"
#include "event_logger.hpp"
#include "maintenance.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace parley {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        Store& store,
        PresenceRegistry& presence,
        StoreExecutor& executor
    )
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , store_(store)
        , presence_(presence)
        , executor_(executor)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

    void stop() {
        net::post(acceptor_.get_executor(), [self = shared_from_this()]() {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

private:
    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    Store& store_;
    PresenceRegistry& presence_;
    StoreExecutor& executor_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;
        }

        if (ec) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::CONNECTION_REJECTED,
                             "internal", "Accept error: " + ec.message());
        } else {
            beast::error_code ep_ec;
            auto ep = socket.remote_endpoint(ep_ec);
            std::string remote_ip = ep_ec ? std::string("unknown") : ep.address().to_string();

            if (presence_.total_connections() >= config_.max_global_connections) {
                EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::CONNECTION_REJECTED,
                                 remote_ip, "Global connection limit reached");
                MetricsRegistry::instance().increment(Counter::ConnectionsRejectedTotal);
            } else if (!presence_.increment_ip_count(remote_ip, config_.max_connections_per_ip)) {
                EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::CONNECTION_REJECTED,
                                 remote_ip, "Per-IP connection limit reached");
            } else {
                // Released when the last session object for this socket goes away.
                auto guard = std::shared_ptr<void>(nullptr, [self_ref = shared_from_this(), remote_ip](void*) {
                    self_ref->presence_.decrement_ip_count(remote_ip);
                });

                if (config_.enable_tls) {
                    std::make_shared<HttpSession>(
                        beast::ssl_stream<beast::tcp_stream>(beast::tcp_stream(std::move(socket)), ssl_ctx_),
                        config_, store_, presence_, executor_, guard
                    )->run();
                } else {
                    std::make_shared<HttpSession>(
                        beast::tcp_stream(std::move(socket)),
                        config_, store_, presence_, executor_, guard
                    )->run();
                }
            }
        }

        do_accept();
    }
};

std::string random_salt() {
    unsigned char b[32];
    if (RAND_bytes(b, sizeof(b)) != 1) {
        throw std::runtime_error("CSPRNG failure while generating salt");
    }
    std::stringstream ss;
    for (unsigned char c : b) ss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return ss.str();
}

}

// Configures the SSL context (TLS 1.2+).
void load_server_certificate(ssl::context& ctx, const std::string& cert_path, const std::string& key_path) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );

    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);

    SSL_CTX_set_cipher_list(ctx.native_handle(),
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256"
    );

    ctx.use_certificate_chain_file(cert_path);
    ctx.use_private_key_file(key_path, ssl::context::pem);
}

int main(int argc, char* argv[]) {
    using parley::EventLogger;
    try {
        parley::ServerConfig config;

        // Defaults, then command line, then environment.
        std::vector<std::string> args(argv + 1, argv + argc);
        try {
            if (!parley::apply_cli_args(config, args)) {
                std::cout << parley::usage_text(argv[0]);
                return 0;
            }
            parley::apply_env_overrides(config);
            parley::validate_config(config);
        } catch (const std::invalid_argument& e) {
            std::cerr << "[!] Configuration error: " << e.what() << "\n"
                      << parley::usage_text(argv[0]);
            return 1;
        }

        EventLogger::Level level;
        if (EventLogger::parse_level(config.log_level, level)) {
            EventLogger::set_min_level(level);
        }

        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        if (config.enable_tls &&
            (!std::filesystem::exists(config.cert_path) || !std::filesystem::exists(config.key_path))) {
            std::cerr << "[!] TLS certificates not found at:\n"
                      << "    " << config.cert_path << "\n"
                      << "    " << config.key_path << "\n"
                      << "[*] Or use --no-tls for development without TLS.\n";
            return 1;
        }

        std::unique_ptr<parley::Store> store;
        try {
            store = std::make_unique<parley::Store>(config.in_memory ? std::string() : config.db_path);
        } catch (const parley::StoreError& e) {
            std::cerr << "[!] Cannot open database: " << e.what() << "\n";
            return 1;
        }

        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE, "internal",
                         "Parley listening on " + config.address + ":" + std::to_string(config.port) +
                         (config.enable_tls ? " (TLS)" : " (plaintext)") +
                         (store->in_memory() ? ", in-memory store" : ", store " + config.db_path));

        // Must outlive the io_context: sessions destroyed with pending handlers unregister here.
        parley::PresenceRegistry presence(config.log_salt.empty() ? parley::random_salt() : config.log_salt);

        net::io_context ioc{config.thread_count};

        ssl::context ssl_ctx{ssl::context::tlsv12};
        if (config.enable_tls) {
            load_server_certificate(ssl_ctx, config.cert_path, config.key_path);
        }

        parley::StoreExecutor executor(static_cast<std::size_t>(config.store_threads));

        auto maintenance = std::make_shared<parley::MaintenanceTimer>(
            ioc, *store, presence, executor, std::chrono::seconds(config.maintenance_interval_sec));
        maintenance->run();

        auto listener = std::make_shared<parley::Listener>(
            ioc,
            ssl_ctx,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            *store,
            presence,
            executor
        );
        listener->run();

        // SIGINT/SIGTERM: stop accepting, close sessions, then stop after a grace period.
        net::steady_timer grace_timer(ioc);
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&](beast::error_code const& ec, int) {
                if (ec) return;
                EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE,
                                 "internal", "Initiating graceful shutdown");
                maintenance->stop();
                listener->stop();
                presence.close_all();
                grace_timer.expires_after(std::chrono::milliseconds(config.shutdown_grace_ms));
                grace_timer.async_wait([&ioc](beast::error_code) {
                    ioc.stop();
                });
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);
        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        executor.stop();
        executor.join();

        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE, "internal",
                         "Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
