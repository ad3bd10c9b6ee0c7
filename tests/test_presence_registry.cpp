#include <gtest/gtest.h>
#include "presence_registry.hpp"
#include "recording_sink.hpp"

#include <algorithm>

using namespace parley;

class PresenceRegistryTest : public ::testing::Test {
protected:
    PresenceRegistry presence{"test_salt"};

    static EventSink::Frame frame(const std::string& text) {
        return std::make_shared<const std::string>(text);
    }
};

TEST_F(PresenceRegistryTest, BlindId) {
    std::string id = "user123";
    std::string blinded = presence.blind_id(id);
    EXPECT_NE(id, blinded);
    EXPECT_EQ(blinded.length(), 64u);
    EXPECT_EQ(blinded, presence.blind_id(id));

    PresenceRegistry other{"other_salt"};
    EXPECT_NE(blinded, other.blind_id(id));
}

TEST_F(PresenceRegistryTest, RegisterIsExclusive) {
    auto first = std::make_shared<RecordingSink>();
    auto second = std::make_shared<RecordingSink>();

    EXPECT_TRUE(presence.register_user(1, first));
    EXPECT_FALSE(presence.register_user(1, second));
    EXPECT_FALSE(presence.register_user(2, nullptr));
    EXPECT_TRUE(presence.is_online(1));
    EXPECT_FALSE(presence.is_online(2));
    EXPECT_EQ(presence.get(1), first);
    EXPECT_EQ(presence.online_count(), 1u);
}

TEST_F(PresenceRegistryTest, UnregisterOnlyRemovesOwnSink) {
    auto owner = std::make_shared<RecordingSink>();
    auto stranger = std::make_shared<RecordingSink>();
    ASSERT_TRUE(presence.register_user(3, owner));

    EXPECT_FALSE(presence.unregister_user(3, stranger.get()));
    EXPECT_TRUE(presence.is_online(3));

    EXPECT_TRUE(presence.unregister_user(3, owner.get()));
    EXPECT_FALSE(presence.is_online(3));
    EXPECT_EQ(presence.get(3), nullptr);

    // Unknown users are a no-op.
    EXPECT_FALSE(presence.unregister_user(99, owner.get()));
}

TEST_F(PresenceRegistryTest, ExpiredEntryCanBeReplaced) {
    {
        auto gone = std::make_shared<RecordingSink>();
        ASSERT_TRUE(presence.register_user(4, gone));
    }
    EXPECT_FALSE(presence.is_online(4));

    auto fresh = std::make_shared<RecordingSink>();
    EXPECT_TRUE(presence.register_user(4, fresh));
    EXPECT_TRUE(presence.is_online(4));
}

TEST_F(PresenceRegistryTest, SendToAndBroadcast) {
    auto a = std::make_shared<RecordingSink>();
    auto b = std::make_shared<RecordingSink>();
    auto c = std::make_shared<RecordingSink>();
    presence.register_user(0, a);
    presence.register_user(1, b);
    presence.register_user(2, c);

    EXPECT_TRUE(presence.send_to(1, frame("direct")));
    EXPECT_FALSE(presence.send_to(7, frame("nobody")));
    EXPECT_EQ(b->frames(), (std::vector<std::string>{"direct"}));
    EXPECT_EQ(a->count(), 0u);

    EXPECT_EQ(presence.broadcast(frame("all"), UserId{0}), 2u);
    EXPECT_EQ(a->count(), 0u);
    EXPECT_EQ(b->frames().back(), "all");
    EXPECT_EQ(c->frames().back(), "all");

    EXPECT_EQ(presence.broadcast(frame("everyone")), 3u);
    EXPECT_EQ(a->frames().back(), "everyone");
}

TEST_F(PresenceRegistryTest, AnnouncementsFollowMapChanges) {
    auto a = std::make_shared<RecordingSink>();
    auto b = std::make_shared<RecordingSink>();
    auto impostor = std::make_shared<RecordingSink>();
    ASSERT_TRUE(presence.register_user(0, a));

    EXPECT_TRUE(presence.register_user(1, b, frame("b-online")));
    EXPECT_EQ(a->frames(), (std::vector<std::string>{"b-online"}));
    EXPECT_EQ(b->count(), 0u);

    // Rejected registrations and foreign unregisters announce nothing.
    EXPECT_FALSE(presence.register_user(1, impostor, frame("dup-online")));
    EXPECT_FALSE(presence.unregister_user(1, impostor.get(), frame("dup-offline")));
    EXPECT_EQ(a->count(), 1u);
    EXPECT_EQ(impostor->count(), 0u);

    EXPECT_TRUE(presence.unregister_user(1, b.get(), frame("b-offline")));
    EXPECT_EQ(a->frames(), (std::vector<std::string>{"b-online", "b-offline"}));
    EXPECT_EQ(b->count(), 0u);

    EXPECT_FALSE(presence.unregister_user(1, b.get(), frame("b-offline-again")));
    EXPECT_EQ(a->count(), 2u);
}

TEST_F(PresenceRegistryTest, SnapshotAndCleanup) {
    auto live = std::make_shared<RecordingSink>();
    presence.register_user(10, live);
    {
        auto dead = std::make_shared<RecordingSink>();
        presence.register_user(11, dead);
    }

    auto ids = presence.snapshot();
    EXPECT_EQ(ids, (std::vector<UserId>{10}));
    EXPECT_EQ(presence.cleanup_dead_entries(), 1u);
    EXPECT_EQ(presence.cleanup_dead_entries(), 0u);
    EXPECT_EQ(presence.online_count(), 1u);
}

TEST_F(PresenceRegistryTest, CloseAllClosesLiveSinks) {
    auto a = std::make_shared<RecordingSink>();
    auto b = std::make_shared<RecordingSink>();
    presence.register_user(0, a);
    presence.register_user(1, b);

    presence.close_all();
    EXPECT_TRUE(a->closed());
    EXPECT_TRUE(b->closed());
}

TEST_F(PresenceRegistryTest, IpAdmission) {
    EXPECT_EQ(presence.connection_count_for_ip("127.0.0.1"), 0u);

    EXPECT_TRUE(presence.increment_ip_count("127.0.0.1", 2));
    EXPECT_TRUE(presence.increment_ip_count("127.0.0.1", 2));
    EXPECT_FALSE(presence.increment_ip_count("127.0.0.1", 2));
    EXPECT_TRUE(presence.increment_ip_count("10.0.0.1", 2));
    EXPECT_EQ(presence.connection_count_for_ip("127.0.0.1"), 2u);
    EXPECT_EQ(presence.total_connections(), 3u);

    presence.decrement_ip_count("127.0.0.1");
    presence.decrement_ip_count("127.0.0.1");
    presence.decrement_ip_count("127.0.0.1");
    EXPECT_EQ(presence.connection_count_for_ip("127.0.0.1"), 0u);
    EXPECT_EQ(presence.total_connections(), 1u);

    EXPECT_FALSE(presence.increment_ip_count("192.168.0.1", 0));
    EXPECT_EQ(presence.connection_count_for_ip("192.168.0.1"), 0u);
}
