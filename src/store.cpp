#include "store.hpp"
#include "event_logger.hpp"
#include "input_validator.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <limits>
#include <sstream>
#include <type_traits>
#include <boost/json.hpp>

namespace json = boost::json;

namespace parley {

namespace {

using Kind = StoreError::Kind;

void check_sql(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK && rc != SQLITE_DONE && rc != SQLITE_ROW) {
        std::ostringstream oss;
        oss << what << " failed: " << sqlite3_errmsg(db) << " (rc=" << rc << ")";
        throw StoreError(Kind::Database, oss.str());
    }
}

void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError(Kind::Database, "sqlite exec failed: " + msg);
    }
}

// Rolls back only if a transaction is still open; SQLite may already have
// rolled back on its own after a failed COMMIT.
void rollback_if_open(sqlite3* db) {
    if (sqlite3_get_autocommit(db) == 0) {
        char* err = nullptr;
        if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::STORE_FAILURE, "store",
                             std::string("Rollback failed: ") + (err ? err : "unknown error"));
        }
        sqlite3_free(err);
    }
}

// Prepared statement owner.
class Stmt {
public:
    Stmt(sqlite3* db, const char* sql) : db_(db), sql_(sql) {
        check_sql(sqlite3_prepare_v2(db, sql, -1, &s_, nullptr), db, sql);
    }
    ~Stmt() {
        if (s_) sqlite3_finalize(s_);
    }

    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;

    Stmt& bind(int index, std::int64_t value) {
        check_sql(sqlite3_bind_int64(s_, index, value), db_, sql_);
        return *this;
    }

    Stmt& bind(int index, const std::string& value) {
        check_sql(sqlite3_bind_text(s_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
                  db_, sql_);
        return *this;
    }

    // True while rows are available.
    bool step() {
        int rc = sqlite3_step(s_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        check_sql(rc, db_, sql_);
        return false;
    }

    void run() {
        while (step()) {
        }
    }

    void reset() {
        sqlite3_reset(s_);
        sqlite3_clear_bindings(s_);
    }

    std::int64_t column_int(int col) const { return sqlite3_column_int64(s_, col); }
    bool column_is_null(int col) const { return sqlite3_column_type(s_, col) == SQLITE_NULL; }

    std::string column_text(int col) const {
        const unsigned char* text = sqlite3_column_text(s_, col);
        int size = sqlite3_column_bytes(s_, col);
        return text ? std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(size))
                    : std::string();
    }

private:
    sqlite3* db_;
    const char* sql_;
    sqlite3_stmt* s_ = nullptr;
};

std::int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Next id for a table: one past the current maximum key, but never below the
// persisted high-water mark, so ids freed by deletion are not handed out again.
std::uint32_t allocate_id(sqlite3* db, const std::string& sequence, const char* max_sql) {
    std::int64_t next = 0;
    {
        Stmt st(db, max_sql);
        if (st.step() && !st.column_is_null(0)) {
            next = st.column_int(0) + 1;
        }
    }
    {
        Stmt st(db, "SELECT next_id FROM id_sequences WHERE name = ?;");
        st.bind(1, sequence);
        if (st.step()) {
            next = std::max(next, st.column_int(0));
        }
    }

    if (next > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
        throw StoreError(Kind::Database, "Id space exhausted for " + sequence);
    }

    Stmt st(db, "INSERT OR REPLACE INTO id_sequences(name, next_id) VALUES(?, ?);");
    st.bind(1, sequence).bind(2, next + 1);
    st.run();
    return static_cast<std::uint32_t>(next);
}

std::string encode_tags(const std::vector<std::string>& tags) {
    json::array arr;
    for (const auto& tag : tags) arr.emplace_back(tag);
    return json::serialize(arr);
}

std::vector<std::string> decode_tags(const std::string& text, MessageId id) {
    std::vector<std::string> tags;
    try {
        auto value = InputValidator::safe_parse_json(text);
        for (const auto& tag : value.as_array()) {
            tags.emplace_back(tag.as_string().c_str());
        }
    } catch (const std::exception& e) {
        throw StoreError(Kind::Database,
                         "Corrupt tag column for message " + std::to_string(id) + ": " + e.what());
    }
    return tags;
}

bool user_exists(sqlite3* db, UserId id) {
    Stmt st(db, "SELECT 1 FROM users WHERE id = ?;");
    st.bind(1, id);
    return st.step();
}

std::optional<Group> load_group(sqlite3* db, GroupId id) {
    Group group;
    {
        Stmt st(db, "SELECT name FROM chat_groups WHERE id = ?;");
        st.bind(1, id);
        if (!st.step()) return std::nullopt;
        group.id = id;
        group.name = st.column_text(0);
    }
    Stmt st(db, "SELECT user_id FROM group_members WHERE group_id = ? ORDER BY user_id;");
    st.bind(1, id);
    while (st.step()) {
        group.members.insert(static_cast<UserId>(st.column_int(0)));
    }
    return group;
}

void write_members(sqlite3* db, GroupId id, const std::set<UserId>& members) {
    Stmt st(db, "INSERT INTO group_members(group_id, user_id) VALUES(?, ?);");
    for (UserId member : members) {
        st.reset();
        st.bind(1, id).bind(2, member);
        st.run();
    }
}

std::optional<Message> load_message(sqlite3* db, MessageId id) {
    Stmt st(db,
            "SELECT sender, recipient_kind, recipient_id, body, created_at, tags "
            "FROM messages WHERE id = ?;");
    st.bind(1, id);
    if (!st.step()) return std::nullopt;

    Message msg;
    msg.id = id;
    msg.sender = static_cast<UserId>(st.column_int(0));
    msg.recipient.kind = st.column_int(1) == 0 ? Recipient::Kind::User : Recipient::Kind::Group;
    msg.recipient.id = static_cast<std::uint32_t>(st.column_int(2));
    msg.body = st.column_text(3);
    msg.created_at = st.column_int(4);
    msg.tags = decode_tags(st.column_text(5), id);
    return msg;
}

Message require_message(sqlite3* db, MessageId id) {
    auto msg = load_message(db, id);
    if (!msg) {
        throw StoreError(Kind::InvalidMessageId, "No message with id " + std::to_string(id));
    }
    return *msg;
}

// Message ids of the delivery-index range (recipient, sender?, *), ascending.
std::vector<MessageId> scan_index(sqlite3* db, const Recipient& recipient,
                                  std::optional<UserId> sender) {
    std::vector<MessageId> ids;
    if (sender) {
        Stmt st(db,
                "SELECT message_id FROM delivery_index "
                "WHERE recipient_kind = ? AND recipient_id = ? AND sender = ? ORDER BY message_id;");
        st.bind(1, static_cast<std::int64_t>(recipient.kind)).bind(2, recipient.id).bind(3, *sender);
        while (st.step()) ids.push_back(static_cast<MessageId>(st.column_int(0)));
    } else {
        Stmt st(db,
                "SELECT message_id FROM delivery_index "
                "WHERE recipient_kind = ? AND recipient_id = ? ORDER BY message_id;");
        st.bind(1, static_cast<std::int64_t>(recipient.kind)).bind(2, recipient.id);
        while (st.step()) ids.push_back(static_cast<MessageId>(st.column_int(0)));
    }
    return ids;
}

// Resolves index hits to messages. Entries pointing at a missing message are
// skipped; genuine SQLite errors still propagate.
std::vector<Message> resolve_messages(sqlite3* db, const std::vector<MessageId>& ids) {
    std::vector<Message> messages;
    messages.reserve(ids.size());
    for (MessageId id : ids) {
        auto msg = load_message(db, id);
        if (!msg) {
            EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::STORE_FAILURE, "store",
                             "Skipping dangling delivery index entry for message " + std::to_string(id));
            continue;
        }
        messages.push_back(std::move(*msg));
    }
    return messages;
}

void insert_index_entry(sqlite3* db, const Message& msg) {
    Stmt st(db,
            "INSERT INTO delivery_index(recipient_kind, recipient_id, sender, message_id) "
            "VALUES(?, ?, ?, ?);");
    st.bind(1, static_cast<std::int64_t>(msg.recipient.kind))
      .bind(2, msg.recipient.id)
      .bind(3, msg.sender)
      .bind(4, msg.id);
    st.run();
}

void remove_message_rows(sqlite3* db, const Message& msg) {
    {
        Stmt st(db, "DELETE FROM messages WHERE id = ?;");
        st.bind(1, msg.id);
        st.run();
    }
    Stmt st(db,
            "DELETE FROM delivery_index "
            "WHERE recipient_kind = ? AND recipient_id = ? AND sender = ? AND message_id = ?;");
    st.bind(1, static_cast<std::int64_t>(msg.recipient.kind))
      .bind(2, msg.recipient.id)
      .bind(3, msg.sender)
      .bind(4, msg.id);
    st.run();
}

// Deletes every index entry under the recipient prefix together with the
// messages they point at. Returns the number of entries removed.
std::size_t remove_index_prefix(sqlite3* db, const Recipient& recipient) {
    auto ids = scan_index(db, recipient, std::nullopt);
    {
        Stmt st(db, "DELETE FROM messages WHERE id = ?;");
        for (MessageId id : ids) {
            st.reset();
            st.bind(1, id);
            st.run();
        }
    }
    Stmt st(db, "DELETE FROM delivery_index WHERE recipient_kind = ? AND recipient_id = ?;");
    st.bind(1, static_cast<std::int64_t>(recipient.kind)).bind(2, recipient.id);
    st.run();
    return ids.size();
}

bool may_delete(sqlite3* db, const Message& msg, UserId acting_user_id) {
    if (msg.sender == acting_user_id) return true;
    if (msg.recipient.is_user()) return msg.recipient.id == acting_user_id;
    auto group = load_group(db, msg.recipient.id);
    return group && group->has_member(acting_user_id);
}

std::size_t count_rows(sqlite3* db, const char* sql) {
    Stmt st(db, sql);
    return st.step() ? static_cast<std::size_t>(st.column_int(0)) : 0;
}

}

const char* StoreError::kind_name(Kind kind) {
    switch (kind) {
        case Kind::UsernameInUse: return "UsernameInUse";
        case Kind::InvalidUserIds: return "InvalidUserIds";
        case Kind::InvalidGroupId: return "InvalidGroupId";
        case Kind::InvalidMessageId: return "InvalidMessageId";
        case Kind::PermissionDenied: return "PermissionDenied";
        case Kind::Database: return "Database";
        default: return "Unknown";
    }
}

Store::Store(const std::string& path)
    : path_(path)
    , in_memory_(path.empty() || path == ":memory:")
{
    writer_ = open_connection(true);
    try {
        init_schema();
    } catch (...) {
        sqlite3_close(writer_);
        writer_ = nullptr;
        throw;
    }
}

Store::~Store() {
    for (sqlite3* db : idle_readers_) {
        sqlite3_close(db);
    }
    if (writer_) sqlite3_close(writer_);
}

sqlite3* Store::open_connection(bool writer) {
    sqlite3* db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX;
    if (writer) flags |= SQLITE_OPEN_CREATE;

    const std::string target = in_memory_ ? ":memory:" : path_;
    int rc = sqlite3_open_v2(target.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw StoreError(Kind::Database, "Failed to open database '" + target + "': " + msg);
    }

    sqlite3_busy_timeout(db, 5000);
    try {
        if (!in_memory_ && writer) {
            exec_sql(db, "PRAGMA journal_mode = WAL;");
            exec_sql(db, "PRAGMA synchronous = NORMAL;");
        }
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
    return db;
}

void Store::init_schema() {
    exec_sql(writer_, R"SQL(
      CREATE TABLE IF NOT EXISTS users (
        id        INTEGER PRIMARY KEY,
        username  TEXT NOT NULL
      );

      CREATE TABLE IF NOT EXISTS usernames (
        username  TEXT PRIMARY KEY,
        id        INTEGER NOT NULL
      ) WITHOUT ROWID;

      CREATE TABLE IF NOT EXISTS chat_groups (
        id    INTEGER PRIMARY KEY,
        name  TEXT NOT NULL
      );

      CREATE TABLE IF NOT EXISTS group_members (
        group_id  INTEGER NOT NULL,
        user_id   INTEGER NOT NULL,
        PRIMARY KEY (group_id, user_id)
      ) WITHOUT ROWID;

      CREATE TABLE IF NOT EXISTS messages (
        id              INTEGER PRIMARY KEY,
        sender          INTEGER NOT NULL,
        recipient_kind  INTEGER NOT NULL,
        recipient_id    INTEGER NOT NULL,
        body            TEXT NOT NULL,
        created_at      INTEGER NOT NULL,
        tags            TEXT NOT NULL DEFAULT '[]'
      );

      CREATE TABLE IF NOT EXISTS delivery_index (
        recipient_kind  INTEGER NOT NULL,
        recipient_id    INTEGER NOT NULL,
        sender          INTEGER NOT NULL,
        message_id      INTEGER NOT NULL,
        PRIMARY KEY (recipient_kind, recipient_id, sender, message_id)
      ) WITHOUT ROWID;

      CREATE TABLE IF NOT EXISTS id_sequences (
        name     TEXT PRIMARY KEY,
        next_id  INTEGER NOT NULL
      ) WITHOUT ROWID;
    )SQL");
}

sqlite3* Store::acquire_reader() {
    {
        std::lock_guard<std::mutex> lock(readers_mutex_);
        if (!idle_readers_.empty()) {
            sqlite3* db = idle_readers_.back();
            idle_readers_.pop_back();
            return db;
        }
    }
    return open_connection(false);
}

void Store::release_reader(sqlite3* db) {
    std::lock_guard<std::mutex> lock(readers_mutex_);
    idle_readers_.push_back(db);
}

template <class Fn>
auto Store::write_tx(Fn&& fn) -> decltype(fn(static_cast<sqlite3*>(nullptr))) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    exec_sql(writer_, "BEGIN IMMEDIATE;");
    try {
        if constexpr (std::is_void_v<decltype(fn(writer_))>) {
            fn(writer_);
            exec_sql(writer_, "COMMIT;");
        } else {
            auto result = fn(writer_);
            exec_sql(writer_, "COMMIT;");
            return result;
        }
    } catch (...) {
        rollback_if_open(writer_);
        throw;
    }
}

template <class Fn>
auto Store::read_tx(Fn&& fn) -> decltype(fn(static_cast<sqlite3*>(nullptr))) {
    auto run = [&fn](sqlite3* db) {
        exec_sql(db, "BEGIN;");
        try {
            auto result = fn(db);
            exec_sql(db, "COMMIT;");
            return result;
        } catch (...) {
            rollback_if_open(db);
            throw;
        }
    };

    // A private in-memory database has exactly one connection.
    if (in_memory_) {
        std::lock_guard<std::mutex> lock(writer_mutex_);
        return run(writer_);
    }

    sqlite3* db = acquire_reader();
    try {
        auto result = run(db);
        release_reader(db);
        return result;
    } catch (...) {
        release_reader(db);
        throw;
    }
}

// --- Users ---

UserId Store::create_user(const std::string& username) {
    return write_tx([&](sqlite3* db) {
        {
            Stmt st(db, "SELECT id FROM usernames WHERE username = ?;");
            st.bind(1, username);
            if (st.step()) {
                throw StoreError(Kind::UsernameInUse, "Username '" + username + "' is already taken");
            }
        }

        UserId id = allocate_id(db, "users", "SELECT MAX(id) FROM users;");
        {
            Stmt st(db, "INSERT INTO users(id, username) VALUES(?, ?);");
            st.bind(1, id).bind(2, username);
            st.run();
        }
        Stmt st(db, "INSERT INTO usernames(username, id) VALUES(?, ?);");
        st.bind(1, username).bind(2, id);
        st.run();
        return id;
    });
}

std::optional<User> Store::get_user_by_id(UserId id) {
    return read_tx([&](sqlite3* db) -> std::optional<User> {
        Stmt st(db, "SELECT username FROM users WHERE id = ?;");
        st.bind(1, id);
        if (!st.step()) return std::nullopt;
        return User{id, st.column_text(0)};
    });
}

std::optional<User> Store::get_user_by_username(const std::string& username) {
    return read_tx([&](sqlite3* db) -> std::optional<User> {
        Stmt st(db, "SELECT id FROM usernames WHERE username = ?;");
        st.bind(1, username);
        if (!st.step()) return std::nullopt;
        return User{static_cast<UserId>(st.column_int(0)), username};
    });
}

std::vector<User> Store::list_users() {
    return read_tx([](sqlite3* db) {
        std::vector<User> users;
        Stmt st(db, "SELECT id, username FROM users ORDER BY id;");
        while (st.step()) {
            users.push_back(User{static_cast<UserId>(st.column_int(0)), st.column_text(1)});
        }
        return users;
    });
}

// --- Groups ---

GroupId Store::create_or_update_group(const std::string& name,
                                      const std::set<UserId>& members,
                                      std::optional<GroupId> existing_group_id,
                                      UserId acting_user_id,
                                      Group* previous) {
    return write_tx([&](sqlite3* db) {
        std::vector<UserId> missing;
        for (UserId member : members) {
            if (!user_exists(db, member)) missing.push_back(member);
        }
        if (!missing.empty()) {
            throw StoreError(Kind::InvalidUserIds, "Group references unknown users", missing);
        }

        if (existing_group_id) {
            GroupId id = *existing_group_id;
            auto existing = load_group(db, id);
            if (!existing) {
                throw StoreError(Kind::InvalidGroupId, "No group with id " + std::to_string(id));
            }
            if (!existing->has_member(acting_user_id)) {
                throw StoreError(Kind::PermissionDenied, "Only group members can edit a group");
            }
            if (previous) *previous = *existing;

            {
                Stmt st(db, "UPDATE chat_groups SET name = ? WHERE id = ?;");
                st.bind(1, name).bind(2, id);
                st.run();
            }
            {
                Stmt st(db, "DELETE FROM group_members WHERE group_id = ?;");
                st.bind(1, id);
                st.run();
            }
            write_members(db, id, members);
            return id;
        }

        GroupId id = allocate_id(db, "groups", "SELECT MAX(id) FROM chat_groups;");
        {
            Stmt st(db, "INSERT INTO chat_groups(id, name) VALUES(?, ?);");
            st.bind(1, id).bind(2, name);
            st.run();
        }
        write_members(db, id, members);
        return id;
    });
}

Group Store::delete_group(GroupId group_id, UserId acting_user_id) {
    return write_tx([&](sqlite3* db) {
        auto group = load_group(db, group_id);
        if (!group) {
            throw StoreError(Kind::InvalidGroupId, "No group with id " + std::to_string(group_id));
        }
        if (!group->has_member(acting_user_id)) {
            throw StoreError(Kind::PermissionDenied, "Only group members can delete a group");
        }

        {
            Stmt st(db, "DELETE FROM chat_groups WHERE id = ?;");
            st.bind(1, group_id);
            st.run();
        }
        {
            Stmt st(db, "DELETE FROM group_members WHERE group_id = ?;");
            st.bind(1, group_id);
            st.run();
        }

        std::size_t removed = remove_index_prefix(db, Recipient::group(group_id));
        EventLogger::log(EventLogger::Level::TRACE, EventLogger::EventType::LIFECYCLE, "store",
                         "Group " + std::to_string(group_id) + " deleted with " +
                         std::to_string(removed) + " messages");
        return *group;
    });
}

std::optional<Group> Store::get_group(GroupId group_id) {
    return read_tx([&](sqlite3* db) { return load_group(db, group_id); });
}

std::map<GroupId, Group> Store::get_groups_for_user(UserId user_id) {
    return read_tx([&](sqlite3* db) {
        if (!user_exists(db, user_id)) {
            throw StoreError(Kind::InvalidUserIds, "No user with id " + std::to_string(user_id),
                             {user_id});
        }

        std::vector<GroupId> ids;
        {
            Stmt st(db, "SELECT group_id FROM group_members WHERE user_id = ? ORDER BY group_id;");
            st.bind(1, user_id);
            while (st.step()) ids.push_back(static_cast<GroupId>(st.column_int(0)));
        }

        std::map<GroupId, Group> groups;
        for (GroupId id : ids) {
            if (auto group = load_group(db, id)) {
                groups.emplace(id, std::move(*group));
            }
        }
        return groups;
    });
}

// --- Messages ---

Message Store::send_message(const std::string& body, UserId sender, const Recipient& recipient) {
    return write_tx([&](sqlite3* db) {
        if (!user_exists(db, sender)) {
            throw StoreError(Kind::InvalidUserIds, "No user with id " + std::to_string(sender), {sender});
        }

        if (recipient.is_group()) {
            auto group = load_group(db, recipient.id);
            if (!group) {
                throw StoreError(Kind::InvalidGroupId, "No group with id " + std::to_string(recipient.id));
            }
            if (!group->has_member(sender)) {
                throw StoreError(Kind::PermissionDenied, "Only group members can post to a group");
            }
        } else if (!user_exists(db, recipient.id)) {
            throw StoreError(Kind::InvalidUserIds, "No user with id " + std::to_string(recipient.id),
                             {recipient.id});
        }

        Message msg;
        msg.id = allocate_id(db, "messages", "SELECT MAX(id) FROM messages;");
        msg.sender = sender;
        msg.recipient = recipient;
        msg.body = body;
        msg.created_at = now_seconds();

        {
            Stmt st(db,
                    "INSERT INTO messages(id, sender, recipient_kind, recipient_id, body, created_at, tags) "
                    "VALUES(?, ?, ?, ?, ?, ?, ?);");
            st.bind(1, msg.id)
              .bind(2, msg.sender)
              .bind(3, static_cast<std::int64_t>(msg.recipient.kind))
              .bind(4, msg.recipient.id)
              .bind(5, msg.body)
              .bind(6, msg.created_at)
              .bind(7, encode_tags(msg.tags));
            st.run();
        }
        insert_index_entry(db, msg);
        return msg;
    });
}

Message Store::delete_message(MessageId message_id, UserId acting_user_id) {
    return write_tx([&](sqlite3* db) {
        Message msg = require_message(db, message_id);
        if (!may_delete(db, msg, acting_user_id)) {
            throw StoreError(Kind::PermissionDenied, "Not allowed to delete message " + std::to_string(message_id));
        }
        remove_message_rows(db, msg);
        return msg;
    });
}

Message Store::edit_message_body(MessageId message_id, const std::string& new_body, UserId acting_user_id) {
    return write_tx([&](sqlite3* db) {
        Message msg = require_message(db, message_id);
        if (msg.sender != acting_user_id) {
            throw StoreError(Kind::PermissionDenied, "Only the sender can edit a message");
        }

        Stmt st(db, "UPDATE messages SET body = ? WHERE id = ?;");
        st.bind(1, new_body).bind(2, message_id);
        st.run();
        msg.body = new_body;
        return msg;
    });
}

Message Store::edit_message_tags(MessageId message_id, const std::vector<std::string>& new_tags,
                                 UserId acting_user_id) {
    return write_tx([&](sqlite3* db) {
        Message msg = require_message(db, message_id);
        if (msg.sender != acting_user_id) {
            throw StoreError(Kind::PermissionDenied, "Only the sender can edit tags");
        }

        msg.tags = InputValidator::normalize_tags(new_tags);
        Stmt st(db, "UPDATE messages SET tags = ? WHERE id = ?;");
        st.bind(1, encode_tags(msg.tags)).bind(2, message_id);
        st.run();
        return msg;
    });
}

std::vector<Message> Store::get_messages(UserId acting_user_id, const Recipient& recipient) {
    if (recipient.is_group()) {
        return get_group_messages(acting_user_id, recipient.id);
    }
    return get_user_messages(acting_user_id, recipient.id);
}

std::vector<Message> Store::get_user_messages(UserId user_a, UserId user_b) {
    return read_tx([&](sqlite3* db) {
        auto sent = scan_index(db, Recipient::user(user_b), user_a);
        auto received = scan_index(db, Recipient::user(user_a), user_b);

        std::vector<MessageId> ids;
        ids.reserve(sent.size() + received.size());
        std::set_union(sent.begin(), sent.end(), received.begin(), received.end(), std::back_inserter(ids));
        return resolve_messages(db, ids);
    });
}

std::vector<Message> Store::get_group_messages(UserId acting_user_id, GroupId group_id) {
    return read_tx([&](sqlite3* db) {
        auto group = load_group(db, group_id);
        if (!group) {
            throw StoreError(Kind::InvalidGroupId, "No group with id " + std::to_string(group_id));
        }
        if (!group->has_member(acting_user_id)) {
            throw StoreError(Kind::PermissionDenied, "Only group members can read a group");
        }
        return resolve_messages(db, scan_index(db, Recipient::group(group_id), std::nullopt));
    });
}

StoreStats Store::stats() {
    return read_tx([](sqlite3* db) {
        StoreStats stats;
        stats.users = count_rows(db, "SELECT COUNT(*) FROM users;");
        stats.groups = count_rows(db, "SELECT COUNT(*) FROM chat_groups;");
        stats.messages = count_rows(db, "SELECT COUNT(*) FROM messages;");
        stats.index_entries = count_rows(db, "SELECT COUNT(*) FROM delivery_index;");
        return stats;
    });
}

}
