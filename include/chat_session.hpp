#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

#include "models.hpp"
#include "presence_registry.hpp"
#include "protocol.hpp"
#include "server_config.hpp"

namespace net = boost::asio;

namespace parley {

class Store;
class StoreExecutor;

// Connection-level rejection reported to the caller as Error{code, message}.
class SessionError : public std::runtime_error {
public:
    SessionError(std::string code, const std::string& what)
        : std::runtime_error(what), code_(std::move(code)) {}

    const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

/**
 * Per-connection actor. Unauthenticated until a RequestUsername succeeds,
 * then Authenticated(user_id) until close().
 *
 * Frames are handled one at a time: handle_frame() runs the request on the
 * store executor and calls on_done on the connection's executor afterwards.
 * The transport issues the next read only from on_done.
 */
class ChatSession : public std::enable_shared_from_this<ChatSession> {
public:
    ChatSession(const ServerConfig& config,
                Store& store,
                PresenceRegistry& presence,
                StoreExecutor& executor,
                std::weak_ptr<EventSink> sink,
                net::any_io_executor home,
                std::string remote_addr);

    ChatSession(const ChatSession&) = delete;
    ChatSession& operator=(const ChatSession&) = delete;

    // on_done(false) means the connection must be torn down.
    void handle_frame(std::string frame, std::function<void(bool ok)> on_done);

    // Synchronous request processing; the dispatch boundary. Runs on a store worker.
    void process_frame(const std::string& frame);

    // Idempotent disconnect cleanup: unregister and announce UserOffline.
    void close();

    std::optional<UserId> user_id() const;
    bool closed() const;
    const std::string& remote_address() const { return remote_addr_; }

private:
    const ServerConfig& config_;
    Store& store_;
    PresenceRegistry& presence_;
    StoreExecutor& executor_;
    std::weak_ptr<EventSink> sink_;
    const EventSink* sink_key_;
    net::any_io_executor home_;
    std::string remote_addr_;

    mutable std::mutex state_mutex_;
    bool closed_ = false;
    std::optional<UserId> user_id_;

    void dispatch(const protocol::ClientRequest& request);

    void on_request(const protocol::RequestUsername& req);
    void on_request(const protocol::GetMessages& req);
    void on_request(const protocol::SendMessage& req);
    void on_request(const protocol::EditMessage& req);
    void on_request(const protocol::EditTags& req);
    void on_request(const protocol::DeleteMessage& req);
    void on_request(const protocol::CreateGroup& req);
    void on_request(const protocol::EditGroup& req);
    void on_request(const protocol::DeleteGroup& req);

    // Authenticated user, or nullopt after logging a warning.
    std::optional<UserId> require_login(const char* request_type);

    void reply(const protocol::ServerEvent& event);
    void send_to_others(const std::set<UserId>& targets, const protocol::ServerEvent& event,
                        UserId caller);

    // Sender plus the direct recipient or the recipient group's members.
    std::set<UserId> participants(const Message& message);
    protocol::GroupView group_view(const Group& group);

    void validate_body(const std::string& body) const;
    void validate_group_name(const std::string& name) const;
};

}
