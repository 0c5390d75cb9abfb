#include <gtest/gtest.h>
#include <thread>
#include "Core/EventQueue.hpp"

using namespace std::chrono_literals;

static DecodedEvent makeEvent(const std::string& line) {
    return DecodedEvent{ std::chrono::system_clock::now(), line };
}

TEST(EventQueue, PreservesOrder) {
    EventQueue q;
    for (int i = 0; i < 10; ++i) q.publish(makeEvent("Decoded " + std::to_string(i)));

    for (int i = 0; i < 10; ++i) {
        DecodedEvent ev;
        ASSERT_TRUE(q.popNext(ev, 10ms));
        EXPECT_EQ(ev.rawLine, "Decoded " + std::to_string(i));
    }
    EXPECT_EQ(q.size(), 0u);
}

TEST(EventQueue, PopTimesOutWhenEmpty) {
    EventQueue q;
    DecodedEvent ev;
    EXPECT_FALSE(q.popNext(ev, 20ms));
}

TEST(EventQueue, DropsOldestBeyondCapacity) {
    EventQueue q;
    for (int i = 0; i < 1030; ++i) q.publish(makeEvent(std::to_string(i)));

    EXPECT_EQ(q.size(), 1024u);
    EXPECT_EQ(q.dropped(), 6u);
    DecodedEvent ev;
    ASSERT_TRUE(q.popNext(ev, 10ms));
    EXPECT_EQ(ev.rawLine, "6");
}

TEST(EventQueue, CloseWakesWaiter) {
    EventQueue q;
    std::thread closer([&] {
        std::this_thread::sleep_for(30ms);
        q.close();
    });

    DecodedEvent ev;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.popNext(ev, 5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    closer.join();

    EXPECT_FALSE(q.publish(makeEvent("Decoded late")));
    q.reopen();
    EXPECT_TRUE(q.publish(makeEvent("Decoded again")));
}

TEST(EventQueue, DeliversAcrossThreads) {
    EventQueue q;
    std::thread producer([&] {
        for (int i = 0; i < 100; ++i) q.publish(makeEvent(std::to_string(i)));
    });

    for (int i = 0; i < 100; ++i) {
        DecodedEvent ev;
        ASSERT_TRUE(q.popNext(ev, 1s));
        EXPECT_EQ(ev.rawLine, std::to_string(i));
    }
    producer.join();
}
