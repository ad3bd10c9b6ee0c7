#include <gtest/gtest.h>
#include "chat_session.hpp"
#include "metrics.hpp"
#include "recording_sink.hpp"
#include "store.hpp"
#include "store_executor.hpp"

#include <boost/asio/io_context.hpp>
#include <thread>

using namespace parley;
namespace json = boost::json;

namespace {

struct Client {
    std::shared_ptr<RecordingSink> sink;
    std::shared_ptr<ChatSession> session;

    void send(const std::string& frame) { session->process_frame(frame); }
    std::vector<std::string> types() const { return sink->types(); }
    json::object last() const { return sink->last(); }
};

std::string login(const std::string& name) {
    return R"({"type":"RequestUsername","username":")" + name + R"("})";
}

std::string send_to_user(const std::string& body, UserId to) {
    return R"({"type":"SendMessage","body":")" + body + R"(","recipient":{"User":)" + std::to_string(to) + "}}";
}

std::string send_to_group(const std::string& body, GroupId to) {
    return R"({"type":"SendMessage","body":")" + body + R"(","recipient":{"Group":)" + std::to_string(to) + "}}";
}

}

class ChatSessionTest : public ::testing::Test {
protected:
    ServerConfig config;
    Store store;
    PresenceRegistry presence{"test_salt"};
    StoreExecutor executor{1};
    net::io_context ioc;

    void SetUp() override {
        MetricsRegistry::instance().reset();
    }

    Client connect() {
        Client c;
        c.sink = std::make_shared<RecordingSink>();
        c.session = std::make_shared<ChatSession>(config, store, presence, executor,
                                                  std::weak_ptr<EventSink>(c.sink),
                                                  ioc.get_executor(), "127.0.0.1");
        return c;
    }

    Client logged_in(const std::string& name) {
        Client c = connect();
        c.send(login(name));
        EXPECT_EQ(c.types().back(), "Welcome");
        c.sink->clear();
        return c;
    }
};

TEST_F(ChatSessionTest, LoginCreatesUserAndAnnounces) {
    Client alice = connect();
    alice.send(login("alice"));

    ASSERT_EQ(alice.types(), (std::vector<std::string>{"Welcome"}));
    auto welcome = alice.last();
    EXPECT_EQ(welcome.at("user_id").to_number<std::int64_t>(), 0);
    EXPECT_EQ(alice.session->user_id(), UserId{0});
    EXPECT_TRUE(presence.is_online(0));

    Client bob = connect();
    bob.send(login("bob"));

    EXPECT_EQ(alice.types().back(), "UserAdded");
    auto added = alice.last().at("user").as_object();
    EXPECT_EQ(added.at("name").as_string(), "bob");
    EXPECT_TRUE(added.at("online").as_bool());

    auto users = bob.last().at("users").as_array();
    ASSERT_EQ(users.size(), 2u);
    EXPECT_TRUE(users[0].as_object().at("online").as_bool());
    // Bob's own welcome must not include a UserAdded for himself.
    EXPECT_EQ(bob.types(), (std::vector<std::string>{"Welcome"}));
}

TEST_F(ChatSessionTest, ReturningUserKeepsIdAndAnnouncesOnline) {
    Client alice = logged_in("alice");
    Client bob = logged_in("bob");
    bob.session->close();
    EXPECT_EQ(alice.types().back(), "UserOffline");

    Client bob_again = connect();
    bob_again.send(login("bob"));
    EXPECT_EQ(bob_again.session->user_id(), UserId{1});
    EXPECT_EQ(alice.types().back(), "UserOnline");
    EXPECT_EQ(alice.last().at("id").to_number<std::int64_t>(), 1);
    EXPECT_EQ(store.list_users().size(), 2u);
}

TEST_F(ChatSessionTest, DuplicateLoginIsRejected) {
    Client first = logged_in("alice");
    Client second = connect();
    second.send(login("alice"));

    auto error = second.last();
    EXPECT_EQ(error.at("type").as_string(), "Error");
    EXPECT_EQ(error.at("code").as_string(), "UsernameInUse");
    EXPECT_FALSE(second.session->user_id());
    EXPECT_EQ(presence.get(0), first.sink);

    // Closing the rejected connection must not take the first one offline.
    second.session->close();
    EXPECT_TRUE(presence.is_online(0));
}

TEST_F(ChatSessionTest, InvalidUsernameIsRejected) {
    Client c = connect();
    c.send(login("no spaces allowed"));
    EXPECT_EQ(c.last().at("code").as_string(), "InvalidUsername");
    c.send(login(""));
    EXPECT_EQ(c.last().at("code").as_string(), "InvalidUsername");
    EXPECT_TRUE(store.list_users().empty());
}

TEST_F(ChatSessionTest, RepeatedLoginIsIgnored) {
    Client alice = logged_in("alice");
    alice.send(login("other"));
    EXPECT_EQ(alice.sink->count(), 0u);
    EXPECT_EQ(alice.session->user_id(), UserId{0});
    EXPECT_FALSE(store.get_user_by_username("other"));
}

TEST_F(ChatSessionTest, RequestsBeforeLoginAreIgnored) {
    logged_in("alice");
    Client anon = connect();
    anon.send(send_to_user("hi", 0));
    anon.send(R"({"type":"GetMessages","recipient":{"User":0}})");
    anon.send(R"({"type":"CreateGroup","name":"g","members":[0]})");
    EXPECT_EQ(anon.sink->count(), 0u);
    EXPECT_EQ(store.stats().messages, 0u);
    EXPECT_EQ(store.stats().groups, 0u);
}

TEST_F(ChatSessionTest, MalformedFramesAreDropped) {
    Client alice = logged_in("alice");
    alice.send("{not json");
    alice.send(R"({"type":"Unknown"})");
    alice.send(R"({"type":"DeleteMessage","id":-3})");
    EXPECT_EQ(alice.sink->count(), 0u);
    EXPECT_EQ(MetricsRegistry::instance().get(Counter::FramesDroppedTotal), 3.0);
}

TEST_F(ChatSessionTest, DirectMessageFanOut) {
    Client alice = logged_in("alice");
    Client bob = logged_in("bob");
    Client carol = logged_in("carol");
    alice.sink->clear();
    bob.sink->clear();

    alice.send(send_to_user("hello bob", 1));

    ASSERT_EQ(alice.types(), (std::vector<std::string>{"MessageSent"}));
    ASSERT_EQ(bob.types(), (std::vector<std::string>{"MessageSent"}));
    EXPECT_EQ(carol.sink->count(), 0u);

    auto msg = bob.last().at("message").as_object();
    EXPECT_EQ(msg.at("body").as_string(), "hello bob");
    EXPECT_EQ(msg.at("sender").to_number<std::int64_t>(), 0);
    EXPECT_EQ(MetricsRegistry::instance().get(Counter::MessagesSentTotal), 1.0);

    bob.send(R"({"type":"GetMessages","recipient":{"User":0}})");
    auto history = bob.last();
    EXPECT_EQ(history.at("type").as_string(), "MessagesForRecipient");
    EXPECT_EQ(history.at("messages").as_array().size(), 1u);
}

TEST_F(ChatSessionTest, MessageToOfflineUserIsStored) {
    Client alice = logged_in("alice");
    store.create_user("offline");

    alice.send(send_to_user("later", 1));
    EXPECT_EQ(alice.types().back(), "MessageSent");
    EXPECT_EQ(store.get_user_messages(0, 1).size(), 1u);
}

TEST_F(ChatSessionTest, SelfMessageAndBadBodiesRejected) {
    Client alice = logged_in("alice");
    logged_in("bob");

    alice.send(send_to_user("me", 0));
    EXPECT_EQ(alice.last().at("code").as_string(), "SelfMessage");

    alice.send(send_to_user("   ", 1));
    EXPECT_EQ(alice.last().at("code").as_string(), "InvalidInput");

    config.max_body_length = 4;
    alice.send(send_to_user("too long", 1));
    EXPECT_EQ(alice.last().at("code").as_string(), "InvalidInput");

    alice.send(send_to_user("hi", 42));
    EXPECT_EQ(alice.last().at("code").as_string(), "InvalidUserIds");

    EXPECT_EQ(store.stats().messages, 0u);
    EXPECT_EQ(MetricsRegistry::instance().get(Counter::RequestErrorsTotal), 4.0);
}

TEST_F(ChatSessionTest, EditsAndDeletes) {
    Client alice = logged_in("alice");
    Client bob = logged_in("bob");
    alice.send(send_to_user("helo", 1));
    alice.sink->clear();
    bob.sink->clear();

    bob.send(R"({"type":"EditMessage","id":0,"new_body":"hijack"})");
    EXPECT_EQ(bob.last().at("code").as_string(), "PermissionDenied");
    EXPECT_EQ(alice.sink->count(), 0u);

    alice.send(R"({"type":"EditMessage","id":0,"new_body":"hello"})");
    EXPECT_EQ(alice.last().at("type").as_string(), "MessageEdited");
    EXPECT_EQ(bob.last().at("body").as_string(), "hello");

    alice.send(R"({"type":"EditTags","id":0,"new_tags":["Greeting, Casual"]})");
    auto tags = bob.last().at("tags").as_array();
    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tags[0].as_string(), "greeting");
    EXPECT_EQ(tags[1].as_string(), "casual");

    // The direct recipient may delete.
    bob.send(R"({"type":"DeleteMessage","id":0})");
    EXPECT_EQ(bob.last().at("type").as_string(), "MessageDeleted");
    EXPECT_EQ(alice.last().at("type").as_string(), "MessageDeleted");

    alice.send(R"({"type":"DeleteMessage","id":0})");
    EXPECT_EQ(alice.last().at("code").as_string(), "InvalidMessageId");
}

TEST_F(ChatSessionTest, TagLimits) {
    Client alice = logged_in("alice");
    logged_in("bob");
    alice.send(send_to_user("x", 1));

    config.max_tags = 2;
    alice.send(R"({"type":"EditTags","id":0,"new_tags":["a","b","c"]})");
    EXPECT_EQ(alice.last().at("code").as_string(), "InvalidInput");

    config.max_tag_length = 3;
    alice.send(R"({"type":"EditTags","id":0,"new_tags":["abcd"]})");
    EXPECT_EQ(alice.last().at("code").as_string(), "InvalidInput");

    alice.send(R"({"type":"EditTags","id":0,"new_tags":[]})");
    EXPECT_EQ(alice.last().at("type").as_string(), "MessageTagsEdited");
    EXPECT_TRUE(alice.last().at("tags").as_array().empty());
}

TEST_F(ChatSessionTest, GroupLifecycleFanOut) {
    Client alice = logged_in("alice");
    Client bob = logged_in("bob");
    Client carol = logged_in("carol");
    alice.sink->clear();
    bob.sink->clear();
    carol.sink->clear();

    // Creator is added automatically.
    alice.send(R"({"type":"CreateGroup","name":"team","members":[1]})");
    EXPECT_EQ(alice.types(), (std::vector<std::string>{"GroupAdded"}));
    EXPECT_EQ(bob.types(), (std::vector<std::string>{"GroupAdded"}));
    EXPECT_EQ(carol.sink->count(), 0u);
    auto group = bob.last().at("group").as_object();
    EXPECT_EQ(group.at("name").as_string(), "team");
    EXPECT_EQ(group.at("member_ids").as_array().size(), 2u);

    bob.send(send_to_group("hey team", 0));
    EXPECT_EQ(alice.types().back(), "MessageSent");
    EXPECT_EQ(carol.sink->count(), 0u);

    carol.send(send_to_group("let me in", 0));
    EXPECT_EQ(carol.last().at("code").as_string(), "PermissionDenied");

    // Swap bob for carol.
    alice.send(R"({"type":"EditGroup","id":0,"new_name":"crew","new_members":[0,2]})");
    EXPECT_EQ(alice.types().back(), "GroupEdited");
    EXPECT_EQ(carol.types().back(), "GroupEdited");
    EXPECT_EQ(bob.types().back(), "GroupDeleted");

    carol.send(R"({"type":"GetMessages","recipient":{"Group":0}})");
    EXPECT_EQ(carol.last().at("messages").as_array().size(), 1u);

    bob.send(R"({"type":"DeleteGroup","id":0})");
    EXPECT_EQ(bob.last().at("code").as_string(), "PermissionDenied");

    carol.send(R"({"type":"DeleteGroup","id":0})");
    EXPECT_EQ(carol.types().back(), "GroupDeleted");
    EXPECT_EQ(alice.types().back(), "GroupDeleted");
    EXPECT_FALSE(store.get_group(0));
    EXPECT_EQ(store.stats().messages, 0u);
}

TEST_F(ChatSessionTest, GroupFanOutUsesMembershipAtWriteTime) {
    Client alice = logged_in("alice");
    Client bob = logged_in("bob");
    Client carol = logged_in("carol");
    alice.send(R"({"type":"CreateGroup","name":"team","members":[1]})");

    // Bob brings carol in from his own connection.
    bob.send(R"({"type":"EditGroup","id":0,"new_name":"team","new_members":[0,1,2]})");
    alice.sink->clear();
    bob.sink->clear();
    carol.sink->clear();

    alice.send(R"({"type":"EditGroup","id":0,"new_name":"solo","new_members":[0]})");
    EXPECT_EQ(alice.types(), (std::vector<std::string>{"GroupEdited"}));
    EXPECT_EQ(bob.types(), (std::vector<std::string>{"GroupDeleted"}));
    EXPECT_EQ(carol.types(), (std::vector<std::string>{"GroupDeleted"}));

    alice.send(R"({"type":"EditGroup","id":0,"new_name":"team","new_members":[0,1,2]})");
    alice.sink->clear();
    bob.sink->clear();
    carol.sink->clear();

    bob.send(R"({"type":"DeleteGroup","id":0})");
    EXPECT_EQ(bob.types(), (std::vector<std::string>{"GroupDeleted"}));
    EXPECT_EQ(alice.types(), (std::vector<std::string>{"GroupDeleted"}));
    EXPECT_EQ(carol.types(), (std::vector<std::string>{"GroupDeleted"}));
}

TEST_F(ChatSessionTest, EditorLeavingGroupGetsDeleted) {
    Client alice = logged_in("alice");
    Client bob = logged_in("bob");
    alice.send(R"({"type":"CreateGroup","name":"pair","members":[1]})");

    alice.send(R"({"type":"EditGroup","id":0,"new_name":"pair","new_members":[1]})");
    EXPECT_EQ(alice.types().back(), "GroupDeleted");
    EXPECT_EQ(bob.types().back(), "GroupEdited");
}

TEST_F(ChatSessionTest, GroupWithUnknownMembersRejected) {
    Client alice = logged_in("alice");
    alice.send(R"({"type":"CreateGroup","name":"ghosts","members":[7,8]})");
    auto error = alice.last();
    EXPECT_EQ(error.at("code").as_string(), "InvalidUserIds");
    EXPECT_EQ(store.stats().groups, 0u);

    alice.send(R"({"type":"CreateGroup","name":"  ","members":[]})");
    EXPECT_EQ(alice.last().at("code").as_string(), "InvalidInput");
}

TEST_F(ChatSessionTest, WelcomeListsGroupsWithMemberNames) {
    Client alice = logged_in("alice");
    logged_in("bob");
    alice.send(R"({"type":"CreateGroup","name":"team","members":[1]})");
    alice.session->close();

    Client again = connect();
    again.send(login("alice"));
    auto groups = again.last().at("groups").as_array();
    ASSERT_EQ(groups.size(), 1u);
    auto members = groups[0].as_object().at("members").as_array();
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[0].as_string(), "alice");
    EXPECT_EQ(members[1].as_string(), "bob");
}

TEST_F(ChatSessionTest, CloseIsIdempotent) {
    Client alice = logged_in("alice");
    Client bob = logged_in("bob");
    alice.sink->clear();

    bob.session->close();
    bob.session->close();
    EXPECT_TRUE(bob.session->closed());
    EXPECT_FALSE(presence.is_online(1));
    EXPECT_EQ(alice.types(), (std::vector<std::string>{"UserOffline"}));

    // Closing an unauthenticated session announces nothing.
    Client anon = connect();
    anon.session->close();
    EXPECT_EQ(alice.sink->count(), 1u);
}

TEST_F(ChatSessionTest, LoginAfterCloseDoesNotRegister) {
    Client c = connect();
    c.session->close();
    c.send(login("late"));
    EXPECT_FALSE(c.session->user_id());
    EXPECT_FALSE(presence.is_online(0));
    EXPECT_EQ(c.sink->count(), 0u);
}

TEST_F(ChatSessionTest, CloseRacingLoginNeverLeavesUserShownOnline) {
    Client observer = logged_in("observer");

    for (int i = 0; i < 200; ++i) {
        Client racer = connect();
        std::string name = "racer" + std::to_string(i);

        std::thread login_thread([&racer, &name] { racer.send(login(name)); });
        racer.session->close();
        login_thread.join();

        auto user = store.get_user_by_username(name);
        ASSERT_TRUE(user.has_value());
        EXPECT_FALSE(presence.is_online(user->id));

        // Either the login lost and nothing was announced, or peers saw it
        // come online and then go offline, in that order.
        std::vector<std::string> seen;
        for (const auto& text : observer.sink->frames()) {
            auto event = json::parse(text).as_object();
            std::string type(event.at("type").as_string().c_str());
            if (type != "UserAdded" && type != "UserOnline" && type != "UserOffline") continue;
            const json::value& id = type == "UserAdded" ? event.at("user").as_object().at("id")
                                                        : event.at("id");
            if (id.to_number<UserId>() == user->id) seen.push_back(type);
        }
        if (!seen.empty()) {
            EXPECT_EQ(seen, (std::vector<std::string>{"UserAdded", "UserOffline"})) << "iteration " << i;
        }
        observer.sink->clear();
    }
}

TEST_F(ChatSessionTest, HandleFrameCompletesOnHomeExecutor) {
    Client alice = connect();
    std::vector<bool> results;

    alice.session->handle_frame(login("alice"), [&](bool ok) { results.push_back(ok); });
    alice.session->handle_frame("garbage", [&](bool ok) { results.push_back(ok); });
    ioc.run();

    EXPECT_EQ(results, (std::vector<bool>{true, true}));
    EXPECT_EQ(alice.types(), (std::vector<std::string>{"Welcome"}));
}
