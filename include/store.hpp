#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <sqlite3.h>

#include "models.hpp"

namespace parley {

// Raised by every Store operation that does not commit. The transaction is
// always rolled back before the exception leaves the Store.
class StoreError : public std::runtime_error {
public:
    enum class Kind {
        UsernameInUse,
        InvalidUserIds,
        InvalidGroupId,
        InvalidMessageId,
        PermissionDenied,
        Database
    };

    StoreError(Kind kind, const std::string& what, std::vector<UserId> invalid_ids = {})
        : std::runtime_error(what), kind_(kind), invalid_ids_(std::move(invalid_ids)) {}

    Kind kind() const noexcept { return kind_; }

    // Offending ids for InvalidUserIds, empty otherwise.
    const std::vector<UserId>& invalid_ids() const noexcept { return invalid_ids_; }

    static const char* kind_name(Kind kind);

private:
    Kind kind_;
    std::vector<UserId> invalid_ids_;
};

struct StoreStats {
    std::size_t users = 0;
    std::size_t groups = 0;
    std::size_t messages = 0;
    std::size_t index_entries = 0;
};

// Embedded transactional store for users, groups, messages and the delivery
// index, backed by a single SQLite database.
//
// Each public method is one transaction. Writers are serialised; readers on a
// file-backed store use their own WAL connections and never block the writer.
// An empty path or ":memory:" opens a private in-memory database.
class Store {
public:
    explicit Store(const std::string& path = "");
    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    bool in_memory() const { return in_memory_; }

    // --- Users ---
    UserId create_user(const std::string& username);
    std::optional<User> get_user_by_id(UserId id);
    std::optional<User> get_user_by_username(const std::string& username);
    std::vector<User> list_users();

    // --- Groups ---
    /**
     * Creates a group, or replaces the name and member set of an existing one.
     * @param existing_group_id Group to overwrite; the acting user must be a member.
     * @param previous If non-null and a group is overwritten, receives the group
     *        as it was inside the same transaction, before the overwrite.
     * @return The id of the created or updated group.
     */
    GroupId create_or_update_group(const std::string& name,
                                   const std::set<UserId>& members,
                                   std::optional<GroupId> existing_group_id,
                                   UserId acting_user_id,
                                   Group* previous = nullptr);

    // Removes the group and every message addressed to it. Returns the group
    // as it was at deletion.
    Group delete_group(GroupId group_id, UserId acting_user_id);

    std::optional<Group> get_group(GroupId group_id);
    std::map<GroupId, Group> get_groups_for_user(UserId user_id);

    // --- Messages ---
    Message send_message(const std::string& body, UserId sender, const Recipient& recipient);
    Message delete_message(MessageId message_id, UserId acting_user_id);
    Message edit_message_body(MessageId message_id, const std::string& new_body, UserId acting_user_id);
    Message edit_message_tags(MessageId message_id, const std::vector<std::string>& new_tags,
                              UserId acting_user_id);

    // Conversation visible to acting_user_id with the given recipient, ascending by id.
    std::vector<Message> get_messages(UserId acting_user_id, const Recipient& recipient);
    std::vector<Message> get_user_messages(UserId user_a, UserId user_b);
    std::vector<Message> get_group_messages(UserId acting_user_id, GroupId group_id);

    StoreStats stats();

private:
    sqlite3* writer_ = nullptr;
    std::mutex writer_mutex_;

    std::string path_;
    bool in_memory_ = false;
    std::vector<sqlite3*> idle_readers_;
    std::mutex readers_mutex_;

    sqlite3* open_connection(bool writer);
    void init_schema();

    sqlite3* acquire_reader();
    void release_reader(sqlite3* db);

    template <class Fn>
    auto write_tx(Fn&& fn) -> decltype(fn(static_cast<sqlite3*>(nullptr)));

    template <class Fn>
    auto read_tx(Fn&& fn) -> decltype(fn(static_cast<sqlite3*>(nullptr)));
};

}
