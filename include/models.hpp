#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace parley {

using UserId = std::uint32_t;
using GroupId = std::uint32_t;
using MessageId = std::uint32_t;

// Addressing target of a message. Ordered by kind first (users before groups),
// then by id, matching the delivery index key layout.
struct Recipient {
    enum class Kind : std::uint8_t {
        User = 0,
        Group = 1
    };

    Kind kind = Kind::User;
    std::uint32_t id = 0;

    static Recipient user(UserId id) { return Recipient{Kind::User, id}; }
    static Recipient group(GroupId id) { return Recipient{Kind::Group, id}; }

    bool is_user() const { return kind == Kind::User; }
    bool is_group() const { return kind == Kind::Group; }

    bool operator==(const Recipient& other) const {
        return kind == other.kind && id == other.id;
    }
    bool operator!=(const Recipient& other) const { return !(*this == other); }
    bool operator<(const Recipient& other) const {
        return std::tie(kind, id) < std::tie(other.kind, other.id);
    }
};

struct User {
    UserId id = 0;
    std::string username;
};

struct Group {
    GroupId id = 0;
    std::string name;
    std::set<UserId> members;

    bool has_member(UserId user) const { return members.count(user) != 0; }
};

struct Message {
    MessageId id = 0;
    UserId sender = 0;
    Recipient recipient;
    std::string body;
    std::int64_t created_at = 0;  // seconds since epoch
    std::vector<std::string> tags;
};

}
