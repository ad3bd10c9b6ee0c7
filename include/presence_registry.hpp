#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "models.hpp"

namespace parley {

// Outbound delivery channel of one connection. Implementations must only
// enqueue; neither call may block on socket I/O.
class EventSink {
public:
    using Frame = std::shared_ptr<const std::string>;

    virtual ~EventSink() = default;

    virtual void send_frame(Frame frame) = 0;
    virtual void close() = 0;
};

// Process-wide map of online users to their delivery channels, plus per-IP
// admission counters for the listener.
class PresenceRegistry {
public:
    using SinkPtr = std::shared_ptr<EventSink>;
    using WeakSinkPtr = std::weak_ptr<EventSink>;

    explicit PresenceRegistry(const std::string& salt);
    ~PresenceRegistry() = default;

    PresenceRegistry(const PresenceRegistry&) = delete;
    PresenceRegistry& operator=(const PresenceRegistry&) = delete;

    // Atomic check-and-insert. Returns false if the user already has a live
    // sink; an expired entry is replaced. A non-null `announce` frame is
    // delivered to every other online user under the same exclusive lock, so
    // presence announcements reach peers in the order the map changed.
    bool register_user(UserId user_id, SinkPtr sink, EventSink::Frame announce = nullptr);

    // Removes the entry only while it still points at `sink` (or has expired).
    // Returns true if an entry was removed; `announce` is then delivered to
    // every other online user as for register_user.
    bool unregister_user(UserId user_id, const EventSink* sink, EventSink::Frame announce = nullptr);

    bool is_online(UserId user_id) const;
    SinkPtr get(UserId user_id) const;
    std::vector<UserId> snapshot() const;
    std::size_t online_count() const;

    // Returns false if the user is not online.
    bool send_to(UserId user_id, const EventSink::Frame& frame) const;
    std::size_t broadcast(const EventSink::Frame& frame,
                          std::optional<UserId> except = std::nullopt) const;

    std::size_t cleanup_dead_entries();
    void close_all();

    // --- Admission control ---
    bool increment_ip_count(const std::string& ip, std::size_t limit);
    void decrement_ip_count(const std::string& ip);
    std::size_t connection_count_for_ip(const std::string& ip) const;
    std::size_t total_connections() const;

    std::string blind_id(const std::string& id) const;

private:
    std::unordered_map<UserId, WeakSinkPtr> sinks_;
    mutable std::shared_mutex sinks_mutex_;

    std::unordered_map<std::string, std::size_t> ip_counts_;
    std::size_t total_connections_ = 0;
    mutable std::shared_mutex ip_mutex_;

    std::string salt_;
};

}
