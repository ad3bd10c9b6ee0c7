#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace parley {

// Server configuration. Defaults below; overridden by command-line arguments
// and then by PARLEY_* environment variables.
struct ServerConfig {
    // --- Network ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    std::string websocket_path = "/socket";
    int thread_count = 0;   // 0 defaults to hardware concurrency
    int store_threads = 4;

    // --- Storage ---
    std::string db_path = "parley.db";
    bool in_memory = false;

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = false;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";

    // --- Connection & Resource Management ---
    size_t max_message_size = 1024 * 1024;  // 1MB
    size_t max_connections_per_ip = 10;
    size_t max_global_connections = 100000;
    int handshake_timeout_sec = 15;
    int idle_timeout_sec = 300;
    int maintenance_interval_sec = 60;
    int shutdown_grace_ms = 500;

    // --- Protocol Constraints ---
    size_t max_username_length = 32;
    size_t max_body_length = 64 * 1024;
    size_t max_group_name_length = 128;
    size_t max_tags = 32;
    size_t max_tag_length = 64;

    // --- Logging ---
    std::string log_level = "info";
    std::string log_salt;  // empty: random per process
};

// Returns the usage text for the server executable.
std::string usage_text(const std::string& program);

/**
 * Applies command-line arguments (excluding argv[0]).
 * @return false if --help was given.
 * @throws std::invalid_argument on unknown flags or malformed values.
 */
bool apply_cli_args(ServerConfig& config, const std::vector<std::string>& args);

// Applies PARLEY_* environment variables. Throws std::invalid_argument on malformed values.
void apply_env_overrides(ServerConfig& config);

// Cross-field checks (port range, thread counts, TLS files named). Throws std::invalid_argument.
void validate_config(const ServerConfig& config);

}
