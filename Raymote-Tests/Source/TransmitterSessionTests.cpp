#include <gtest/gtest.h>
#include <future>
#include "Core/Errors.hpp"
#include "Core/Reactor.hpp"
#include "Core/Serial/TransmitterSession.hpp"
#include "TestUtils.hpp"

using namespace std::chrono_literals;

namespace {

class TransmitterSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        tx = std::make_unique<TransmitterSession>(reactor.io());
        reactor.start();
    }
    void TearDown() override { reactor.stop(); }

    bool connect(const std::optional<std::string>& path, ConnectResult& res, std::string& err) {
        return reactor.call([&] { return tx->connect(path, res, err); });
    }

    std::future<std::string> send(const TransmitCommand& cmd) {
        auto done = std::make_shared<std::promise<std::string>>();
        auto fut = done->get_future();
        reactor.post([this, cmd, done] {
            tx->send(cmd, [done](const std::string& e) { done->set_value(e); });
        });
        return fut;
    }

    Reactor reactor;
    std::unique_ptr<TransmitterSession> tx;
};

} // namespace

TEST_F(TransmitterSessionTest, SendWithoutConnectionFailsImmediately) {
    std::string result = "unset";
    bool called = false;
    tx->send({ "NEC", 32, "0x1" }, [&](const std::string& e) { called = true; result = e; });

    EXPECT_TRUE(called);
    EXPECT_EQ(result, kErrNotConnected);
    EXPECT_EQ(tx->pendingWrites(), 0u);
}

TEST_F(TransmitterSessionTest, WritesExactCommandBytes) {
    PtyPair dev;
    ASSERT_TRUE(dev.valid());
    ConnectResult res;
    std::string err;
    ASSERT_TRUE(connect(dev.slavePath(), res, err)) << err;
    EXPECT_TRUE(res.connected);

    auto fut = send({ "NEC", 32, "0x1" });
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "");

    EXPECT_EQ(dev.read(11), "NEC,32,0x1\n");
    EXPECT_EQ(dev.read(1, 100ms), "");
}

TEST_F(TransmitterSessionTest, ConcurrentSendsAreNotInterleaved) {
    PtyPair dev;
    ASSERT_TRUE(dev.valid());
    ConnectResult res;
    std::string err;
    ASSERT_TRUE(connect(dev.slavePath(), res, err)) << err;

    std::vector<std::future<std::string>> futs;
    std::string expected;
    for (int i = 0; i < 20; ++i) {
        TransmitCommand cmd{ "SONY", 12, "0xA9" + std::to_string(i) };
        expected += FormatTransmitLine(cmd);
        futs.push_back(send(cmd));
    }

    for (auto& f : futs) {
        ASSERT_EQ(f.wait_for(2s), std::future_status::ready);
        EXPECT_EQ(f.get(), "");
    }
    EXPECT_EQ(dev.read(expected.size()), expected);
}

TEST_F(TransmitterSessionTest, DisconnectThenSendIsNotConnected) {
    PtyPair dev;
    ASSERT_TRUE(dev.valid());
    ConnectResult res;
    std::string err;
    ASSERT_TRUE(connect(dev.slavePath(), res, err)) << err;

    ASSERT_TRUE(connect(std::nullopt, res, err));
    EXPECT_FALSE(res.connected);
    EXPECT_EQ(tx->state().status, SessionStatus::Disconnected);
    EXPECT_TRUE(dev.slaveClosed());

    auto fut = send({ "NEC", 32, "0x1" });
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), kErrNotConnected);
}

TEST_F(TransmitterSessionTest, ReconnectKeepsSingleConnection) {
    PtyPair a, b;
    ASSERT_TRUE(a.valid());
    ASSERT_TRUE(b.valid());
    ConnectResult res;
    std::string err;
    ASSERT_TRUE(connect(a.slavePath(), res, err)) << err;
    ASSERT_TRUE(connect(b.slavePath(), res, err)) << err;

    EXPECT_TRUE(a.slaveClosed());

    auto fut = send({ "RC5", 12, "0x2" });
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "");
    EXPECT_EQ(b.read(11), "RC5,12,0x2\n");
}

TEST_F(TransmitterSessionTest, OpenFailureLeavesSessionUnconnected) {
    ConnectResult res;
    std::string err;
    EXPECT_FALSE(connect(std::string("/dev/ttyACM_raymote_missing"), res, err));
    EXPECT_EQ(err.rfind(kErrOpenFailed, 0), 0u) << err;
    EXPECT_EQ(tx->state().status, SessionStatus::Failed);

    auto fut = send({ "NEC", 32, "0x1" });
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), kErrNotConnected);
}

TEST_F(TransmitterSessionTest, UnpluggedDeviceFailsSendAndSession) {
    PtyPair dev;
    ASSERT_TRUE(dev.valid());
    ConnectResult res;
    std::string err;
    ASSERT_TRUE(connect(dev.slavePath(), res, err)) << err;

    // cavo scollegato: la scrittura sullo slave restituisce EIO
    dev.closeMaster();

    std::string sendErr;
    for (int i = 0; i < 5 && sendErr.empty(); ++i) {
        auto fut = send({ "NEC", 32, "0x" + std::to_string(i) });
        ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
        sendErr = fut.get();
    }

    ASSERT_FALSE(sendErr.empty());
    EXPECT_EQ(sendErr.rfind(std::string(kErrWriteFailed) + ": ", 0), 0u) << sendErr;
    EXPECT_TRUE(WaitFor([this] { return tx->state().status == SessionStatus::Failed; }));
    EXPECT_FALSE(tx->state().reason.empty());
    EXPECT_EQ(tx->portPath(), "");

    auto after = send({ "NEC", 32, "0x1" });
    ASSERT_EQ(after.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(after.get(), kErrNotConnected);
}

TEST_F(TransmitterSessionTest, QueuedSendsFailWhenDeviceIsLost) {
    PtyPair dev;
    ASSERT_TRUE(dev.valid());
    ConnectResult res;
    std::string err;
    ASSERT_TRUE(connect(dev.slavePath(), res, err)) << err;
    dev.closeMaster();

    std::vector<std::future<std::string>> futs;
    for (int i = 0; i < 10; ++i) futs.push_back(send({ "SONY", 12, "0xA90" }));

    size_t failed = 0;
    for (auto& f : futs) {
        ASSERT_EQ(f.wait_for(2s), std::future_status::ready);
        const std::string e = f.get();
        if (e.empty()) continue;
        ++failed;
        // in coda, in volo o dopo la chiusura: mai un errore diverso
        EXPECT_TRUE(e.rfind(kErrWriteFailed, 0) == 0 || e == kErrNotConnected) << e;
    }
    EXPECT_GT(failed, 0u);
    EXPECT_EQ(tx->state().status, SessionStatus::Failed);
    EXPECT_EQ(reactor.call([this] { return tx->pendingWrites(); }), 0u);
}
