#include "chat_session.hpp"
#include "event_logger.hpp"
#include "input_validator.hpp"
#include "metrics.hpp"
#include "store.hpp"
#include "store_executor.hpp"

#include <map>

namespace parley {

namespace {

EventSink::Frame make_frame(const protocol::ServerEvent& event) {
    return std::make_shared<const std::string>(protocol::encode_event(event));
}

} // namespace

ChatSession::ChatSession(const ServerConfig& config,
                         Store& store,
                         PresenceRegistry& presence,
                         StoreExecutor& executor,
                         std::weak_ptr<EventSink> sink,
                         net::any_io_executor home,
                         std::string remote_addr)
    : config_(config)
    , store_(store)
    , presence_(presence)
    , executor_(executor)
    , sink_(std::move(sink))
    , sink_key_(sink_.lock().get())
    , home_(std::move(home))
    , remote_addr_(std::move(remote_addr))
{
}

void ChatSession::handle_frame(std::string frame, std::function<void(bool ok)> on_done) {
    auto self = shared_from_this();
    executor_.submit(
        home_,
        [self, frame = std::move(frame)]() {
            self->process_frame(frame);
        },
        [self, on_done = std::move(on_done)](std::exception_ptr error) {
            if (!error) {
                on_done(true);
                return;
            }
            // Anything that escaped process_frame is fatal for this connection only.
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                EventLogger::log(EventLogger::Level::CRITICAL, EventLogger::EventType::REQUEST_FAILED,
                                 self->remote_addr_, std::string("Connection aborted: ") + e.what());
            } catch (...) {
                EventLogger::log(EventLogger::Level::CRITICAL, EventLogger::EventType::REQUEST_FAILED,
                                 self->remote_addr_, "Connection aborted: non-standard exception");
            }
            on_done(false);
        });
}

void ChatSession::process_frame(const std::string& frame) {
    auto& metrics = MetricsRegistry::instance();
    metrics.increment(Counter::RequestsTotal);

    protocol::ClientRequest request;
    try {
        request = protocol::decode_request(frame);
    } catch (const protocol::DecodeError& e) {
        metrics.increment(Counter::FramesDroppedTotal);
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::PROTOCOL_VIOLATION,
                         remote_addr_, std::string("Dropped frame: ") + e.what());
        return;
    }

    try {
        dispatch(request);
    } catch (const SessionError& e) {
        metrics.increment(Counter::RequestErrorsTotal);
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::INVALID_INPUT,
                         remote_addr_, e.code() + ": " + e.what());
        reply(protocol::Error{e.code(), e.what()});
    } catch (const StoreError& e) {
        metrics.increment(Counter::RequestErrorsTotal);
        if (e.kind() == StoreError::Kind::Database) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORE_FAILURE,
                             "store", e.what());
            reply(protocol::Error{"Internal", "Internal server error"});
            return;
        }
        auto event = e.kind() == StoreError::Kind::PermissionDenied
            ? EventLogger::EventType::PERMISSION_DENIED
            : EventLogger::EventType::REQUEST_FAILED;
        EventLogger::log(EventLogger::Level::INFO, event, remote_addr_,
                         std::string(protocol::type_name(request)) + " rejected: " + e.what());
        reply(protocol::Error{StoreError::kind_name(e.kind()), e.what()});
    } catch (const std::exception& e) {
        metrics.increment(Counter::RequestErrorsTotal);
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::REQUEST_FAILED,
                         remote_addr_, std::string(protocol::type_name(request)) + " failed: " + e.what());
        reply(protocol::Error{"Internal", "Internal server error"});
    }
}

void ChatSession::dispatch(const protocol::ClientRequest& request) {
    std::visit([this](const auto& req) { on_request(req); }, request);
}

void ChatSession::close() {
    std::optional<UserId> uid;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closed_) return;
        closed_ = true;
        uid = user_id_;
    }

    if (!uid) return;

    // Announces UserOffline only if this session still held the slot.
    presence_.unregister_user(*uid, sink_key_, make_frame(protocol::UserOffline{*uid}));
    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::SESSION_CLOSED,
                     remote_addr_, "user=" + std::to_string(*uid));
}

std::optional<UserId> ChatSession::user_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return user_id_;
}

bool ChatSession::closed() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return closed_;
}

std::optional<UserId> ChatSession::require_login(const char* request_type) {
    auto uid = user_id();
    if (!uid) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::PROTOCOL_VIOLATION,
                         remote_addr_, std::string(request_type) + " before login ignored");
    }
    return uid;
}

void ChatSession::reply(const protocol::ServerEvent& event) {
    if (auto sink = sink_.lock()) {
        sink->send_frame(make_frame(event));
    }
}

void ChatSession::send_to_others(const std::set<UserId>& targets, const protocol::ServerEvent& event,
                                 UserId caller) {
    EventSink::Frame frame;
    for (UserId target : targets) {
        if (target == caller) continue;
        if (!frame) frame = make_frame(event);
        presence_.send_to(target, frame);
    }
}

std::set<UserId> ChatSession::participants(const Message& message) {
    std::set<UserId> targets{message.sender};
    if (message.recipient.is_user()) {
        targets.insert(message.recipient.id);
    } else if (auto group = store_.get_group(message.recipient.id)) {
        targets.insert(group->members.begin(), group->members.end());
    }
    return targets;
}

protocol::GroupView ChatSession::group_view(const Group& group) {
    protocol::GroupView view;
    view.id = group.id;
    view.name = group.name;
    for (UserId member : group.members) {
        auto user = store_.get_user_by_id(member);
        view.member_ids.push_back(member);
        view.members.push_back(user ? user->username : std::string());
    }
    return view;
}

void ChatSession::validate_body(const std::string& body) const {
    if (InputValidator::is_blank(body)) {
        throw SessionError("InvalidInput", "Message body must not be blank");
    }
    if (!InputValidator::is_within_size_limit(body.size(), config_.max_body_length)) {
        throw SessionError("InvalidInput", "Message body exceeds " +
                           std::to_string(config_.max_body_length) + " bytes");
    }
}

void ChatSession::validate_group_name(const std::string& name) const {
    if (InputValidator::is_blank(name)) {
        throw SessionError("InvalidInput", "Group name must not be blank");
    }
    if (!InputValidator::is_within_size_limit(name.size(), config_.max_group_name_length)) {
        throw SessionError("InvalidInput", "Group name exceeds " +
                           std::to_string(config_.max_group_name_length) + " bytes");
    }
}

// --- Authentication ---

void ChatSession::on_request(const protocol::RequestUsername& req) {
    if (user_id()) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::PROTOCOL_VIOLATION,
                         remote_addr_, "Repeated RequestUsername ignored");
        return;
    }

    if (!InputValidator::is_valid_username(req.username, config_.max_username_length)) {
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::AUTH_FAILURE,
                         remote_addr_, "Invalid username");
        throw SessionError("InvalidUsername",
                           "Usernames are 1-" + std::to_string(config_.max_username_length) +
                           " letters, digits or underscores");
    }

    bool created = false;
    UserId uid = 0;
    if (auto existing = store_.get_user_by_username(req.username)) {
        uid = existing->id;
    } else {
        try {
            uid = store_.create_user(req.username);
            created = true;
        } catch (const StoreError& e) {
            // Lost a creation race with another login of the same name.
            if (e.kind() != StoreError::Kind::UsernameInUse) throw;
            auto winner = store_.get_user_by_username(req.username);
            if (!winner) throw;
            uid = winner->id;
        }
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closed_) {
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::AUTH_FAILURE,
                             remote_addr_, "Connection closed during login");
            return;
        }
        auto announce = created
            ? make_frame(protocol::UserAdded{{uid, req.username, true}})
            : make_frame(protocol::UserOnline{uid});
        // close() must take this lock before it can unregister, so its
        // UserOffline always follows this announcement.
        auto sink = sink_.lock();
        if (!sink || !presence_.register_user(uid, sink, announce)) {
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::AUTH_FAILURE,
                             remote_addr_, "user=" + std::to_string(uid) + " already online");
            throw SessionError("UsernameInUse", "User '" + req.username + "' is already connected");
        }
        user_id_ = uid;
    }

    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::AUTH_SUCCESS,
                     remote_addr_, "user=" + std::to_string(uid) + (created ? " (new)" : ""));

    protocol::Welcome welcome;
    welcome.user_id = uid;
    std::map<UserId, std::string> names;
    for (const auto& user : store_.list_users()) {
        names[user.id] = user.username;
        welcome.users.push_back({user.id, user.username, presence_.is_online(user.id)});
    }
    for (const auto& [gid, group] : store_.get_groups_for_user(uid)) {
        protocol::GroupView view;
        view.id = gid;
        view.name = group.name;
        for (UserId member : group.members) {
            view.member_ids.push_back(member);
            auto it = names.find(member);
            view.members.push_back(it != names.end() ? it->second : std::string());
        }
        welcome.groups.push_back(std::move(view));
    }
    reply(welcome);
}

// --- Messages ---

void ChatSession::on_request(const protocol::GetMessages& req) {
    auto uid = require_login("GetMessages");
    if (!uid) return;

    reply(protocol::MessagesForRecipient{req.recipient, store_.get_messages(*uid, req.recipient)});
}

void ChatSession::on_request(const protocol::SendMessage& req) {
    auto uid = require_login("SendMessage");
    if (!uid) return;

    if (req.recipient.is_user() && req.recipient.id == *uid) {
        throw SessionError("SelfMessage", "Cannot send a message to yourself");
    }
    validate_body(req.body);

    Message message = store_.send_message(req.body, *uid, req.recipient);
    MetricsRegistry::instance().increment(Counter::MessagesSentTotal);

    protocol::MessageSent event{message};
    reply(event);
    send_to_others(participants(message), event, *uid);
}

void ChatSession::on_request(const protocol::EditMessage& req) {
    auto uid = require_login("EditMessage");
    if (!uid) return;

    validate_body(req.new_body);
    Message message = store_.edit_message_body(req.id, req.new_body, *uid);

    protocol::MessageEdited event{message.id, message.body};
    reply(event);
    send_to_others(participants(message), event, *uid);
}

void ChatSession::on_request(const protocol::EditTags& req) {
    auto uid = require_login("EditTags");
    if (!uid) return;

    auto tags = InputValidator::normalize_tags(req.new_tags);
    if (tags.size() > config_.max_tags) {
        throw SessionError("InvalidInput", "At most " + std::to_string(config_.max_tags) + " tags allowed");
    }
    for (const auto& tag : tags) {
        if (tag.size() > config_.max_tag_length) {
            throw SessionError("InvalidInput", "Tag exceeds " + std::to_string(config_.max_tag_length) +
                               " characters");
        }
    }

    Message message = store_.edit_message_tags(req.id, tags, *uid);

    protocol::MessageTagsEdited event{message.id, message.tags};
    reply(event);
    send_to_others(participants(message), event, *uid);
}

void ChatSession::on_request(const protocol::DeleteMessage& req) {
    auto uid = require_login("DeleteMessage");
    if (!uid) return;

    Message message = store_.delete_message(req.id, *uid);

    protocol::MessageDeleted event{message.id};
    reply(event);
    send_to_others(participants(message), event, *uid);
}

// --- Groups ---

void ChatSession::on_request(const protocol::CreateGroup& req) {
    auto uid = require_login("CreateGroup");
    if (!uid) return;

    validate_group_name(req.name);
    std::set<UserId> members(req.members.begin(), req.members.end());
    members.insert(*uid);

    GroupId gid = store_.create_or_update_group(req.name, members, std::nullopt, *uid);

    protocol::GroupAdded event{group_view(Group{gid, req.name, members})};
    reply(event);
    send_to_others(members, event, *uid);
}

void ChatSession::on_request(const protocol::EditGroup& req) {
    auto uid = require_login("EditGroup");
    if (!uid) return;

    validate_group_name(req.new_name);
    std::set<UserId> members(req.new_members.begin(), req.new_members.end());

    // Membership before the overwrite, read inside the same write transaction.
    Group previous;
    store_.create_or_update_group(req.new_name, members, req.id, *uid, &previous);

    std::set<UserId> removed;
    for (UserId member : previous.members) {
        if (members.count(member) == 0) removed.insert(member);
    }

    protocol::GroupEdited edited{group_view(Group{req.id, req.new_name, members})};
    protocol::GroupDeleted dropped{req.id};

    if (members.count(*uid)) {
        reply(edited);
    } else {
        reply(dropped);
    }
    send_to_others(members, edited, *uid);
    send_to_others(removed, dropped, *uid);
}

void ChatSession::on_request(const protocol::DeleteGroup& req) {
    auto uid = require_login("DeleteGroup");
    if (!uid) return;

    Group deleted = store_.delete_group(req.id, *uid);

    protocol::GroupDeleted event{req.id};
    reply(event);
    send_to_others(deleted.members, event, *uid);
}

}
