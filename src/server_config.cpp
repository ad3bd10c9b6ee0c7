#include "server_config.hpp"
#include "event_logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace parley {

namespace {

unsigned long long parse_unsigned(const std::string& text, const std::string& what,
                                  unsigned long long max_value) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        throw std::invalid_argument("Invalid value for " + what + ": '" + text + "'");
    }
    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Value out of range for " + what + ": '" + text + "'");
    }
    if (value > max_value) {
        throw std::invalid_argument("Value out of range for " + what + ": '" + text + "'");
    }
    return value;
}

uint16_t parse_port(const std::string& text, const std::string& what) {
    auto value = parse_unsigned(text, what, std::numeric_limits<uint16_t>::max());
    if (value == 0) {
        throw std::invalid_argument("Port must be non-zero for " + what);
    }
    return static_cast<uint16_t>(value);
}

int parse_count(const std::string& text, const std::string& what) {
    return static_cast<int>(parse_unsigned(text, what, 1024));
}

bool parse_bool(const std::string& text, const std::string& what) {
    std::string lower;
    for (char c : text) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw std::invalid_argument("Invalid boolean for " + what + ": '" + text + "'");
}

const std::string& next_value(const std::vector<std::string>& args, std::size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + args[i]);
    }
    return args[++i];
}

}

std::string usage_text(const std::string& program) {
    std::stringstream ss;
    ss << "Usage: " << program << " [port] [options]\n"
       << "Options:\n"
       << "  --db PATH           SQLite database file (default parley.db)\n"
       << "  --memory            Keep all state in memory\n"
       << "  --tls               Enable TLS\n"
       << "  --no-tls, -n        Disable TLS (for local development)\n"
       << "  --threads N         I/O threads (0 = hardware concurrency)\n"
       << "  --store-threads N   Store worker threads\n"
       << "  --help, -h          Show this help\n";
    return ss.str();
}

bool apply_cli_args(ServerConfig& config, const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--no-tls" || arg == "-n") {
            config.enable_tls = false;
        } else if (arg == "--tls") {
            config.enable_tls = true;
        } else if (arg == "--memory") {
            config.in_memory = true;
        } else if (arg == "--db") {
            config.db_path = next_value(args, i);
            config.in_memory = false;
        } else if (arg == "--threads") {
            config.thread_count = parse_count(next_value(args, i), "--threads");
        } else if (arg == "--store-threads") {
            config.store_threads = parse_count(next_value(args, i), "--store-threads");
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else {
            config.port = parse_port(arg, "port");
        }
    }
    return true;
}

void apply_env_overrides(ServerConfig& config) {
    if (const char* e = std::getenv("PARLEY_ADDR")) config.address = e;
    if (const char* e = std::getenv("PARLEY_PORT")) config.port = parse_port(e, "PARLEY_PORT");
    if (const char* e = std::getenv("PARLEY_DB_PATH")) {
        config.db_path = e;
        config.in_memory = false;
    }
    if (const char* e = std::getenv("PARLEY_IN_MEMORY")) config.in_memory = parse_bool(e, "PARLEY_IN_MEMORY");
    if (const char* e = std::getenv("PARLEY_THREADS")) config.thread_count = parse_count(e, "PARLEY_THREADS");
    if (const char* e = std::getenv("PARLEY_STORE_THREADS")) {
        config.store_threads = parse_count(e, "PARLEY_STORE_THREADS");
    }
    if (const char* e = std::getenv("PARLEY_ENABLE_TLS")) config.enable_tls = parse_bool(e, "PARLEY_ENABLE_TLS");
    if (const char* e = std::getenv("PARLEY_CERT_PATH")) config.cert_path = e;
    if (const char* e = std::getenv("PARLEY_KEY_PATH")) config.key_path = e;
    if (const char* e = std::getenv("PARLEY_MAX_CONNS_PER_IP")) {
        config.max_connections_per_ip = static_cast<size_t>(
            parse_unsigned(e, "PARLEY_MAX_CONNS_PER_IP", std::numeric_limits<uint32_t>::max()));
    }
    if (const char* e = std::getenv("PARLEY_MAX_MESSAGE_SIZE")) {
        config.max_message_size = static_cast<size_t>(
            parse_unsigned(e, "PARLEY_MAX_MESSAGE_SIZE", std::numeric_limits<uint32_t>::max()));
    }
    if (const char* e = std::getenv("PARLEY_LOG_LEVEL")) {
        EventLogger::Level level;
        if (!EventLogger::parse_level(e, level)) {
            throw std::invalid_argument(std::string("Invalid PARLEY_LOG_LEVEL: '") + e + "'");
        }
        config.log_level = e;
    }
}

void validate_config(const ServerConfig& config) {
    if (config.port == 0) {
        throw std::invalid_argument("Port must be non-zero");
    }
    if (config.store_threads < 1) {
        throw std::invalid_argument("At least one store thread is required");
    }
    if (!config.in_memory && config.db_path.empty()) {
        throw std::invalid_argument("Database path is empty; use --memory for an in-memory store");
    }
    if (config.enable_tls && (config.cert_path.empty() || config.key_path.empty())) {
        throw std::invalid_argument("TLS enabled without certificate and key paths");
    }
    if (config.websocket_path.empty() || config.websocket_path[0] != '/') {
        throw std::invalid_argument("WebSocket path must start with '/'");
    }
    if (config.max_message_size == 0) {
        throw std::invalid_argument("Maximum message size must be non-zero");
    }
}

}
