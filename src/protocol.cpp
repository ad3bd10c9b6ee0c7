#include "protocol.hpp"
#include "input_validator.hpp"

#include <limits>
#include <type_traits>

namespace json = boost::json;

namespace parley {
namespace protocol {

namespace {

template <class> inline constexpr bool always_false = false;

const json::value& require_field(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v) {
        throw DecodeError(std::string("Missing field '") + key + "'");
    }
    return *v;
}

std::uint32_t to_id(const json::value& v, const char* what) {
    std::uint64_t raw = 0;
    if (v.is_uint64()) {
        raw = v.get_uint64();
    } else if (v.is_int64()) {
        if (v.get_int64() < 0) throw DecodeError(std::string("Negative ") + what);
        raw = static_cast<std::uint64_t>(v.get_int64());
    } else {
        throw DecodeError(std::string("Expected integer for ") + what);
    }
    if (raw > std::numeric_limits<std::uint32_t>::max()) {
        throw DecodeError(std::string("Out of range ") + what);
    }
    return static_cast<std::uint32_t>(raw);
}

std::uint32_t id_field(const json::object& obj, const char* key) {
    return to_id(require_field(obj, key), key);
}

std::string string_field(const json::object& obj, const char* key) {
    const json::value& v = require_field(obj, key);
    if (!v.is_string()) {
        throw DecodeError(std::string("Expected string for '") + key + "'");
    }
    return std::string(v.get_string().c_str(), v.get_string().size());
}

std::vector<std::string> string_array_field(const json::object& obj, const char* key) {
    const json::value& v = require_field(obj, key);
    if (!v.is_array()) {
        throw DecodeError(std::string("Expected array for '") + key + "'");
    }
    std::vector<std::string> out;
    for (const auto& item : v.get_array()) {
        if (!item.is_string()) {
            throw DecodeError(std::string("Expected strings in '") + key + "'");
        }
        out.emplace_back(item.get_string().c_str(), item.get_string().size());
    }
    return out;
}

std::vector<std::uint32_t> id_array_field(const json::object& obj, const char* key) {
    const json::value& v = require_field(obj, key);
    if (!v.is_array()) {
        throw DecodeError(std::string("Expected array for '") + key + "'");
    }
    std::vector<std::uint32_t> out;
    for (const auto& item : v.get_array()) {
        out.push_back(to_id(item, key));
    }
    return out;
}

json::array string_array(const std::vector<std::string>& items) {
    json::array arr;
    for (const auto& s : items) arr.emplace_back(s);
    return arr;
}

json::array id_array(const std::vector<std::uint32_t>& ids) {
    json::array arr;
    for (auto id : ids) arr.emplace_back(id);
    return arr;
}

json::object user_to_json(const UserView& u) {
    json::object obj;
    obj["id"] = u.id;
    obj["name"] = u.name;
    obj["online"] = u.online;
    return obj;
}

json::object group_to_json(const GroupView& g) {
    json::object obj;
    obj["id"] = g.id;
    obj["name"] = g.name;
    obj["member_ids"] = id_array(g.member_ids);
    obj["members"] = string_array(g.members);
    return obj;
}

} // namespace

const char* type_name(const ClientRequest& request) {
    return std::visit([](const auto& r) -> const char* {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, RequestUsername>) return "RequestUsername";
        else if constexpr (std::is_same_v<T, GetMessages>) return "GetMessages";
        else if constexpr (std::is_same_v<T, SendMessage>) return "SendMessage";
        else if constexpr (std::is_same_v<T, EditMessage>) return "EditMessage";
        else if constexpr (std::is_same_v<T, EditTags>) return "EditTags";
        else if constexpr (std::is_same_v<T, DeleteMessage>) return "DeleteMessage";
        else if constexpr (std::is_same_v<T, CreateGroup>) return "CreateGroup";
        else if constexpr (std::is_same_v<T, EditGroup>) return "EditGroup";
        else if constexpr (std::is_same_v<T, DeleteGroup>) return "DeleteGroup";
        else static_assert(always_false<T>, "unhandled request type");
    }, request);
}

const char* type_name(const ServerEvent& event) {
    return std::visit([](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Error>) return "Error";
        else if constexpr (std::is_same_v<T, Welcome>) return "Welcome";
        else if constexpr (std::is_same_v<T, UserAdded>) return "UserAdded";
        else if constexpr (std::is_same_v<T, UserOnline>) return "UserOnline";
        else if constexpr (std::is_same_v<T, UserOffline>) return "UserOffline";
        else if constexpr (std::is_same_v<T, MessagesForRecipient>) return "MessagesForRecipient";
        else if constexpr (std::is_same_v<T, MessageSent>) return "MessageSent";
        else if constexpr (std::is_same_v<T, MessageEdited>) return "MessageEdited";
        else if constexpr (std::is_same_v<T, MessageTagsEdited>) return "MessageTagsEdited";
        else if constexpr (std::is_same_v<T, MessageDeleted>) return "MessageDeleted";
        else if constexpr (std::is_same_v<T, GroupAdded>) return "GroupAdded";
        else if constexpr (std::is_same_v<T, GroupEdited>) return "GroupEdited";
        else if constexpr (std::is_same_v<T, GroupDeleted>) return "GroupDeleted";
        else static_assert(always_false<T>, "unhandled event type");
    }, event);
}

json::value recipient_to_json(const Recipient& recipient) {
    json::object obj;
    obj[recipient.is_user() ? "User" : "Group"] = recipient.id;
    return obj;
}

Recipient recipient_from_json(const json::value& value) {
    if (!value.is_object() || value.get_object().size() != 1) {
        throw DecodeError("Recipient must be {\"User\": id} or {\"Group\": id}");
    }
    const auto& obj = value.get_object();
    if (const auto* id = obj.if_contains("User")) {
        return Recipient::user(to_id(*id, "recipient"));
    }
    if (const auto* id = obj.if_contains("Group")) {
        return Recipient::group(to_id(*id, "recipient"));
    }
    throw DecodeError("Unknown recipient kind");
}

json::object message_to_json(const Message& message) {
    json::object obj;
    obj["id"] = message.id;
    obj["sender"] = message.sender;
    obj["recipient"] = recipient_to_json(message.recipient);
    obj["body"] = message.body;
    obj["created_at"] = message.created_at;
    obj["tags"] = string_array(message.tags);
    return obj;
}

ClientRequest decode_request(std::string_view frame) {
    json::value doc;
    try {
        doc = InputValidator::safe_parse_json(frame);
    } catch (const boost::system::system_error& e) {
        throw DecodeError(std::string("Malformed JSON: ") + e.what());
    }

    if (!doc.is_object()) {
        throw DecodeError("Request must be a JSON object");
    }
    const auto& obj = doc.get_object();
    const std::string type = string_field(obj, "type");

    if (type == "RequestUsername") {
        return RequestUsername{string_field(obj, "username")};
    }
    if (type == "GetMessages") {
        return GetMessages{recipient_from_json(require_field(obj, "recipient"))};
    }
    if (type == "SendMessage") {
        return SendMessage{string_field(obj, "body"),
                           recipient_from_json(require_field(obj, "recipient"))};
    }
    if (type == "EditMessage") {
        return EditMessage{id_field(obj, "id"), string_field(obj, "new_body")};
    }
    if (type == "EditTags") {
        return EditTags{id_field(obj, "id"), string_array_field(obj, "new_tags")};
    }
    if (type == "DeleteMessage") {
        return DeleteMessage{id_field(obj, "id")};
    }
    if (type == "CreateGroup") {
        return CreateGroup{string_field(obj, "name"), id_array_field(obj, "members")};
    }
    if (type == "EditGroup") {
        return EditGroup{id_field(obj, "id"), string_field(obj, "new_name"),
                         id_array_field(obj, "new_members")};
    }
    if (type == "DeleteGroup") {
        return DeleteGroup{id_field(obj, "id")};
    }
    throw DecodeError("Unknown request type '" + type + "'");
}

std::string encode_request(const ClientRequest& request) {
    json::object obj;
    obj["type"] = type_name(request);

    std::visit([&obj](const auto& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, RequestUsername>) {
            obj["username"] = r.username;
        } else if constexpr (std::is_same_v<T, GetMessages>) {
            obj["recipient"] = recipient_to_json(r.recipient);
        } else if constexpr (std::is_same_v<T, SendMessage>) {
            obj["body"] = r.body;
            obj["recipient"] = recipient_to_json(r.recipient);
        } else if constexpr (std::is_same_v<T, EditMessage>) {
            obj["id"] = r.id;
            obj["new_body"] = r.new_body;
        } else if constexpr (std::is_same_v<T, EditTags>) {
            obj["id"] = r.id;
            obj["new_tags"] = string_array(r.new_tags);
        } else if constexpr (std::is_same_v<T, DeleteMessage>) {
            obj["id"] = r.id;
        } else if constexpr (std::is_same_v<T, CreateGroup>) {
            obj["name"] = r.name;
            obj["members"] = id_array(r.members);
        } else if constexpr (std::is_same_v<T, EditGroup>) {
            obj["id"] = r.id;
            obj["new_name"] = r.new_name;
            obj["new_members"] = id_array(r.new_members);
        } else if constexpr (std::is_same_v<T, DeleteGroup>) {
            obj["id"] = r.id;
        } else {
            static_assert(always_false<T>, "unhandled request type");
        }
    }, request);

    return json::serialize(obj);
}

std::string encode_event(const ServerEvent& event) {
    json::object obj;
    obj["type"] = type_name(event);

    std::visit([&obj](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Error>) {
            obj["code"] = e.code;
            obj["message"] = e.message;
        } else if constexpr (std::is_same_v<T, Welcome>) {
            obj["user_id"] = e.user_id;
            json::array users;
            for (const auto& u : e.users) users.emplace_back(user_to_json(u));
            obj["users"] = std::move(users);
            json::array groups;
            for (const auto& g : e.groups) groups.emplace_back(group_to_json(g));
            obj["groups"] = std::move(groups);
        } else if constexpr (std::is_same_v<T, UserAdded>) {
            obj["user"] = user_to_json(e.user);
        } else if constexpr (std::is_same_v<T, UserOnline> || std::is_same_v<T, UserOffline>) {
            obj["id"] = e.id;
        } else if constexpr (std::is_same_v<T, MessagesForRecipient>) {
            obj["recipient"] = recipient_to_json(e.recipient);
            json::array messages;
            for (const auto& m : e.messages) {
                json::array pair;
                pair.emplace_back(m.id);
                pair.emplace_back(message_to_json(m));
                messages.emplace_back(std::move(pair));
            }
            obj["messages"] = std::move(messages);
        } else if constexpr (std::is_same_v<T, MessageSent>) {
            obj["id"] = e.message.id;
            obj["message"] = message_to_json(e.message);
        } else if constexpr (std::is_same_v<T, MessageEdited>) {
            obj["id"] = e.id;
            obj["body"] = e.body;
        } else if constexpr (std::is_same_v<T, MessageTagsEdited>) {
            obj["id"] = e.id;
            obj["tags"] = string_array(e.tags);
        } else if constexpr (std::is_same_v<T, MessageDeleted>) {
            obj["id"] = e.id;
        } else if constexpr (std::is_same_v<T, GroupAdded> || std::is_same_v<T, GroupEdited>) {
            obj["group"] = group_to_json(e.group);
        } else if constexpr (std::is_same_v<T, GroupDeleted>) {
            obj["id"] = e.id;
        } else {
            static_assert(always_false<T>, "unhandled event type");
        }
    }, event);

    return json::serialize(obj);
}

}
}
