#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>
#include "Core/Reactor.hpp"
#include "Core/Events/EventBroadcaster.hpp"

using namespace std::chrono_literals;

namespace {

std::string dataOf(const std::string& frame) {
    if (frame.rfind("data: ", 0) != 0 || frame.size() < 8) return {};
    return nlohmann::json::parse(frame.substr(6, frame.size() - 8)).value("data", "");
}

DecodedEvent makeEvent(int i) {
    return DecodedEvent{ std::chrono::system_clock::now(), "Decoded NEC 32 0x" + std::to_string(i) };
}

// raccoglie i frame evento (ignora i keepalive)
std::vector<std::string> drain(Subscriber& sub) {
    std::vector<std::string> out;
    std::string f;
    while (sub.popNext(f, 20ms)) {
        if (f != kKeepaliveFrame) out.push_back(dataOf(f));
    }
    return out;
}

class EventBroadcasterTest : public ::testing::Test {
protected:
    void SetUp() override { reactor.start(); }
    void TearDown() override {
        broadcaster.reset();
        reactor.stop();
    }

    void make(std::chrono::milliseconds keepalive = 10s, size_t maxPending = Subscriber::kDefaultMaxPending) {
        broadcaster = std::make_unique<EventBroadcaster>(reactor.io(), keepalive, maxPending);
    }

    Reactor reactor;
    std::unique_ptr<EventBroadcaster> broadcaster;
};

} // namespace

TEST_F(EventBroadcasterTest, EverySubscriberGetsEveryEventInOrder) {
    make();
    constexpr int kSubs = 4;
    constexpr int kEvents = 50;

    std::vector<std::shared_ptr<Subscriber>> subs;
    for (int i = 0; i < kSubs; ++i) subs.push_back(broadcaster->subscribe());

    for (int i = 0; i < kEvents; ++i) {
        EXPECT_EQ(broadcaster->publish(makeEvent(i)), static_cast<size_t>(kSubs));
    }

    for (auto& sub : subs) {
        auto got = drain(*sub);
        ASSERT_EQ(got.size(), static_cast<size_t>(kEvents));
        for (int i = 0; i < kEvents; ++i) EXPECT_EQ(got[i], "Decoded NEC 32 0x" + std::to_string(i));
    }
}

TEST_F(EventBroadcasterTest, UnsubscribeMidStreamLeavesOthersIntact) {
    make();
    auto a = broadcaster->subscribe();
    auto b = broadcaster->subscribe();
    auto c = broadcaster->subscribe();

    for (int i = 0; i < 20; ++i) broadcaster->publish(makeEvent(i));
    broadcaster->unsubscribe(b);
    for (int i = 20; i < 50; ++i) EXPECT_EQ(broadcaster->publish(makeEvent(i)), 2u);

    EXPECT_EQ(drain(*a).size(), 50u);
    EXPECT_EQ(drain(*c).size(), 50u);
    EXPECT_TRUE(b->isClosed());
    EXPECT_EQ(drain(*b).size(), 20u);
    EXPECT_EQ(broadcaster->size(), 2u);
}

TEST_F(EventBroadcasterTest, UnsubscribeIsIdempotent) {
    make();
    auto a = broadcaster->subscribe();
    auto b = broadcaster->subscribe();

    broadcaster->unsubscribe(a);
    broadcaster->unsubscribe(a);
    broadcaster->unsubscribe(nullptr);

    EXPECT_EQ(broadcaster->size(), 1u);
    EXPECT_FALSE(b->isClosed());
}

TEST_F(EventBroadcasterTest, ClosedChannelIsPrunedWithoutAffectingOthers) {
    make();
    auto a = broadcaster->subscribe();
    auto dead = broadcaster->subscribe();
    auto c = broadcaster->subscribe();

    dead->close(); // il client se n'è andato
    EXPECT_EQ(broadcaster->publish(makeEvent(1)), 2u);
    EXPECT_EQ(broadcaster->size(), 2u);

    EXPECT_EQ(drain(*a).size(), 1u);
    EXPECT_EQ(drain(*c).size(), 1u);
}

TEST_F(EventBroadcasterTest, SlowSubscriberIsDisconnected) {
    make(10s, 2);
    auto slow = broadcaster->subscribe();
    auto fast = broadcaster->subscribe();

    for (int i = 0; i < 3; ++i) {
        broadcaster->publish(makeEvent(i));
        std::string f;
        ASSERT_TRUE(fast->popNext(f, 100ms));
    }

    EXPECT_TRUE(slow->isClosed());
    EXPECT_EQ(broadcaster->size(), 1u);
}

TEST_F(EventBroadcasterTest, KeepaliveIsSentPeriodically) {
    make(30ms);
    auto sub = broadcaster->subscribe();

    int pings = 0;
    std::string f;
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (pings < 2 && std::chrono::steady_clock::now() < deadline) {
        if (sub->popNext(f, 100ms) && f == kKeepaliveFrame) ++pings;
    }
    EXPECT_EQ(pings, 2);
}

TEST_F(EventBroadcasterTest, KeepaliveStopsAfterUnsubscribe) {
    make(20ms);
    auto sub = broadcaster->subscribe();
    broadcaster->unsubscribe(sub);

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(sub->pending(), 0u);
}

TEST_F(EventBroadcasterTest, ClearClosesEverySubscriber) {
    make();
    auto a = broadcaster->subscribe();
    auto b = broadcaster->subscribe();

    broadcaster->clear();
    EXPECT_EQ(broadcaster->size(), 0u);
    EXPECT_TRUE(a->isClosed());
    EXPECT_TRUE(b->isClosed());
    EXPECT_EQ(broadcaster->publish(makeEvent(0)), 0u);
}
