#include <openssl/sha.h>
#include <iomanip>
#include <mutex>
#include <sstream>
#include "presence_registry.hpp"
#include "metrics.hpp"
#include "event_logger.hpp"

namespace parley {

PresenceRegistry::PresenceRegistry(const std::string& salt) : salt_(salt) {
}

namespace {

// Caller holds the exclusive lock. Sinks only enqueue, so this never blocks on I/O.
void announce_locked(const std::unordered_map<UserId, PresenceRegistry::WeakSinkPtr>& sinks,
                     const EventSink::Frame& frame, UserId except) {
    if (!frame) return;
    for (const auto& [id, weak] : sinks) {
        if (id == except) continue;
        if (auto sink = weak.lock()) {
            sink->send_frame(frame);
        }
    }
}

}

bool PresenceRegistry::register_user(UserId user_id, SinkPtr sink, EventSink::Frame announce) {
    if (!sink) return false;

    std::unique_lock lock(sinks_mutex_);
    auto it = sinks_.find(user_id);
    if (it != sinks_.end() && !it->second.expired()) {
        return false;
    }
    sinks_[user_id] = sink;
    MetricsRegistry::instance().set(Gauge::UsersOnline, static_cast<double>(sinks_.size()));
    announce_locked(sinks_, announce, user_id);
    return true;
}

bool PresenceRegistry::unregister_user(UserId user_id, const EventSink* sink, EventSink::Frame announce) {
    std::unique_lock lock(sinks_mutex_);
    auto it = sinks_.find(user_id);
    if (it == sinks_.end()) return false;

    auto existing = it->second.lock();
    // A fresh login may already own the slot; leave it alone.
    if (existing && existing.get() != sink) return false;

    sinks_.erase(it);
    MetricsRegistry::instance().set(Gauge::UsersOnline, static_cast<double>(sinks_.size()));
    announce_locked(sinks_, announce, user_id);
    return true;
}

bool PresenceRegistry::is_online(UserId user_id) const {
    std::shared_lock lock(sinks_mutex_);
    auto it = sinks_.find(user_id);
    return it != sinks_.end() && !it->second.expired();
}

PresenceRegistry::SinkPtr PresenceRegistry::get(UserId user_id) const {
    std::shared_lock lock(sinks_mutex_);
    auto it = sinks_.find(user_id);
    if (it != sinks_.end()) {
        return it->second.lock();
    }
    return nullptr;
}

std::vector<UserId> PresenceRegistry::snapshot() const {
    std::vector<UserId> ids;
    std::shared_lock lock(sinks_mutex_);
    ids.reserve(sinks_.size());
    for (const auto& [id, weak] : sinks_) {
        if (!weak.expired()) ids.push_back(id);
    }
    return ids;
}

std::size_t PresenceRegistry::online_count() const {
    std::shared_lock lock(sinks_mutex_);
    std::size_t count = 0;
    for (const auto& [id, weak] : sinks_) {
        if (!weak.expired()) ++count;
    }
    return count;
}

bool PresenceRegistry::send_to(UserId user_id, const EventSink::Frame& frame) const {
    std::shared_lock lock(sinks_mutex_);
    auto it = sinks_.find(user_id);
    if (it == sinks_.end()) return false;
    if (auto sink = it->second.lock()) {
        sink->send_frame(frame);
        return true;
    }
    return false;
}

std::size_t PresenceRegistry::broadcast(const EventSink::Frame& frame,
                                        std::optional<UserId> except) const {
    std::size_t delivered = 0;
    std::shared_lock lock(sinks_mutex_);
    for (const auto& [id, weak] : sinks_) {
        if (except && *except == id) continue;
        if (auto sink = weak.lock()) {
            sink->send_frame(frame);
            ++delivered;
        }
    }
    return delivered;
}

// Drops entries whose connection went away without unregistering.
std::size_t PresenceRegistry::cleanup_dead_entries() {
    std::unique_lock lock(sinks_mutex_);
    std::size_t removed = 0;
    for (auto it = sinks_.begin(); it != sinks_.end(); ) {
        if (it->second.expired()) {
            it = sinks_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        MetricsRegistry::instance().set(Gauge::UsersOnline, static_cast<double>(sinks_.size()));
    }
    return removed;
}

void PresenceRegistry::close_all() {
    std::vector<SinkPtr> live;
    {
        std::shared_lock lock(sinks_mutex_);
        for (const auto& [id, weak] : sinks_) {
            if (auto sink = weak.lock()) {
                live.push_back(sink);
            }
        }
    }

    for (const auto& sink : live) {
        try {
            sink->close();
        } catch (const std::exception& e) {
            EventLogger::log(EventLogger::Level::WARNING,
                             EventLogger::EventType::LIFECYCLE,
                             "internal",
                             std::string("Close during shutdown failed: ") + e.what());
        }
    }
}

bool PresenceRegistry::increment_ip_count(const std::string& ip, std::size_t limit) {
    std::string b_ip = blind_id(ip);
    std::unique_lock lock(ip_mutex_);
    std::size_t& count = ip_counts_[b_ip];
    if (count >= limit) {
        if (count == 0) ip_counts_.erase(b_ip);
        MetricsRegistry::instance().increment(Counter::ConnectionsRejectedTotal);
        return false;
    }
    ++count;
    ++total_connections_;
    return true;
}

void PresenceRegistry::decrement_ip_count(const std::string& ip) {
    std::string b_ip = blind_id(ip);
    std::unique_lock lock(ip_mutex_);
    auto it = ip_counts_.find(b_ip);
    if (it == ip_counts_.end()) return;

    if (it->second > 0) {
        --it->second;
        if (total_connections_ > 0) --total_connections_;
    }
    if (it->second == 0) {
        ip_counts_.erase(it);
    }
}

std::size_t PresenceRegistry::connection_count_for_ip(const std::string& ip) const {
    std::string b_ip = blind_id(ip);
    std::shared_lock lock(ip_mutex_);
    auto it = ip_counts_.find(b_ip);
    return it != ip_counts_.end() ? it->second : 0;
}

std::size_t PresenceRegistry::total_connections() const {
    std::shared_lock lock(ip_mutex_);
    return total_connections_;
}

// Salted SHA-256 of an identifier, hex encoded.
std::string PresenceRegistry::blind_id(const std::string& id) const {
    std::string data = id + salt_;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

}
