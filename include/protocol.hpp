#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <boost/json.hpp>

#include "models.hpp"

namespace parley {
namespace protocol {

// --- Client -> Server ---

struct RequestUsername {
    std::string username;
};

struct GetMessages {
    Recipient recipient;
};

struct SendMessage {
    std::string body;
    Recipient recipient;
};

struct EditMessage {
    MessageId id = 0;
    std::string new_body;
};

struct EditTags {
    MessageId id = 0;
    std::vector<std::string> new_tags;
};

struct DeleteMessage {
    MessageId id = 0;
};

struct CreateGroup {
    std::string name;
    std::vector<UserId> members;
};

struct EditGroup {
    GroupId id = 0;
    std::string new_name;
    std::vector<UserId> new_members;
};

struct DeleteGroup {
    GroupId id = 0;
};

using ClientRequest = std::variant<
    RequestUsername,
    GetMessages,
    SendMessage,
    EditMessage,
    EditTags,
    DeleteMessage,
    CreateGroup,
    EditGroup,
    DeleteGroup
>;

// --- Server -> Client ---

struct UserView {
    UserId id = 0;
    std::string name;
    bool online = false;
};

struct GroupView {
    GroupId id = 0;
    std::string name;
    std::vector<UserId> member_ids;
    std::vector<std::string> members;  // usernames, same order as member_ids
};

struct Error {
    std::string code;
    std::string message;
};

struct Welcome {
    UserId user_id = 0;
    std::vector<UserView> users;
    std::vector<GroupView> groups;
};

struct UserAdded {
    UserView user;
};

struct UserOnline {
    UserId id = 0;
};

struct UserOffline {
    UserId id = 0;
};

struct MessagesForRecipient {
    Recipient recipient;
    std::vector<Message> messages;
};

struct MessageSent {
    Message message;
};

struct MessageEdited {
    MessageId id = 0;
    std::string body;
};

struct MessageTagsEdited {
    MessageId id = 0;
    std::vector<std::string> tags;
};

struct MessageDeleted {
    MessageId id = 0;
};

struct GroupAdded {
    GroupView group;
};

struct GroupEdited {
    GroupView group;
};

struct GroupDeleted {
    GroupId id = 0;
};

using ServerEvent = std::variant<
    Error,
    Welcome,
    UserAdded,
    UserOnline,
    UserOffline,
    MessagesForRecipient,
    MessageSent,
    MessageEdited,
    MessageTagsEdited,
    MessageDeleted,
    GroupAdded,
    GroupEdited,
    GroupDeleted
>;

// Raised for frames that are not a well-formed request.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Name of the "type" tag for a request or event.
const char* type_name(const ClientRequest& request);
const char* type_name(const ServerEvent& event);

ClientRequest decode_request(std::string_view frame);
std::string encode_request(const ClientRequest& request);

std::string encode_event(const ServerEvent& event);

// Building blocks, exposed for tests and for tooling that embeds messages.
boost::json::value recipient_to_json(const Recipient& recipient);
Recipient recipient_from_json(const boost::json::value& value);
boost::json::object message_to_json(const Message& message);

}
}
