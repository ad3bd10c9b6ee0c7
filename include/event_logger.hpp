#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace parley {

// Structured event log. Peer addresses are blinded with a rotating salt
// (salted SHA-256) so raw client IPs never reach the log.
class EventLogger {
public:
    enum class Level {
        TRACE,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        LIFECYCLE,
        SESSION_OPENED,
        SESSION_CLOSED,
        AUTH_SUCCESS,
        AUTH_FAILURE,
        INVALID_INPUT,
        PERMISSION_DENIED,
        REQUEST_FAILED,
        STORE_FAILURE,
        PROTOCOL_VIOLATION,
        CONNECTION_REJECTED
    };

    static void set_min_level(Level level) { min_level_ref().store(level); }
    static Level min_level() { return min_level_ref().load(); }

    // Accepts "trace"/"debug", "info", "warn"/"warning", "error", "critical" (any case).
    static bool parse_level(const std::string& text, Level& out) {
        std::string lower;
        for (char c : text) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lower == "trace" || lower == "debug") out = Level::TRACE;
        else if (lower == "info") out = Level::INFO;
        else if (lower == "warn" || lower == "warning") out = Level::WARNING;
        else if (lower == "error") out = Level::ERROR;
        else if (lower == "critical" || lower == "crit") out = Level::CRITICAL;
        else return false;
        return true;
    }

    /**
     * Records an event.
     * @param level Severity; events below the configured minimum are dropped.
     * @param event Event category.
     * @param peer Remote address ("internal"/"store" for server-side sources); blinded before output.
     * @param message Optional free text (sanitised).
     */
    static void log(Level level, EventType event, const std::string& peer,
                    const std::string& message = "") {
        if (level < min_level()) return;

        std::string line = format_line(level, event, blind_peer(peer), message);

        // ERROR and above go to stderr
        if (level >= Level::ERROR) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
    }

    static std::string format_line(Level level, EventType event, const std::string& peer,
                                   const std::string& message) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "peer=" << peer;
        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        return ss.str();
    }

    // Replaces quotes, backslashes and line breaks with spaces and drops other
    // non-printable bytes so one event always stays on one line.
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::TRACE: return "TRACE";
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::LIFECYCLE: return "LIFECYCLE";
            case EventType::SESSION_OPENED: return "SESSION_OPENED";
            case EventType::SESSION_CLOSED: return "SESSION_CLOSED";
            case EventType::AUTH_SUCCESS: return "AUTH_SUCCESS";
            case EventType::AUTH_FAILURE: return "AUTH_FAILURE";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::PERMISSION_DENIED: return "PERMISSION_DENIED";
            case EventType::REQUEST_FAILED: return "REQUEST_FAILED";
            case EventType::STORE_FAILURE: return "STORE_FAILURE";
            case EventType::PROTOCOL_VIOLATION: return "PROTOCOL";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            default: return "UNKNOWN_EVENT";
        }
    }

private:
    static std::atomic<Level>& min_level_ref() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    // Server-side sources are logged as-is; anything else is treated as an
    // address and hashed with a salt that rotates every 6 hours.
    static std::string blind_peer(const std::string& peer) {
        if (peer.empty() || peer == "unknown" || peer == "internal" || peer == "store") {
            return peer.empty() ? "unknown" : peer;
        }

        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::string salt;
        {
            std::lock_guard<std::mutex> lock(salt_mutex);
            auto now_steady = std::chrono::steady_clock::now();
            if (log_salt.empty() ||
                std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
                unsigned char b[32];
                if (RAND_bytes(b, 32) != 1) {
                    std::cerr << "[CRITICAL] CSPRNG failure in EventLogger. Terminating.\n";
                    std::terminate();
                }
                std::stringstream salt_ss;
                for (int i = 0; i < 32; i++) {
                    salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
                }
                log_salt = salt_ss.str();
                last_rotation = now_steady;
            }
            salt = log_salt;
        }

        std::string data = peer + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }
};

}
