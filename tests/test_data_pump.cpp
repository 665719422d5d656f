#include <gtest/gtest.h>
#include <managers/data_pump.hpp>
#include <atomic>
#include <mutex>
#include "fake_ssh.hpp"

using namespace std::chrono_literals;

namespace {

struct EndRecorder {
    std::mutex m;
    std::vector<std::pair<ChannelEnd, std::string>> ends;

    ChannelEndCallback callback() {
        return [this](ChannelEnd end, const std::string& reason, StopSignal&) {
            std::lock_guard<std::mutex> lock(m);
            ends.emplace_back(end, reason);
        };
    }
    size_t count() {
        std::lock_guard<std::mutex> lock(m);
        return ends.size();
    }
};

std::string drain_text(DeliveryQueue& q) {
    std::string out;
    for (auto& c : q.drain()) out += c.text;
    return out;
}

} // namespace

TEST(DataPump, PushesOutputInOrder) {
    auto shell = std::make_shared<FakeShell>();
    FakeShellChannel channel(shell);
    DeliveryQueue q;
    EndRecorder rec;

    DataPump pump(channel, q, 5ms, rec.callback());
    shell->feed("$ ");
    shell->feed("echo hi\r\n");
    pump.start();

    ASSERT_TRUE(wait_until([&] { return q.last_seq() >= 2; }));
    shell->feed("hi\r\n");
    ASSERT_TRUE(wait_until([&] { return q.last_seq() >= 3; }));

    pump.request_stop();
    pump.join();
    EXPECT_EQ(drain_text(q), "$ echo hi\r\nhi\r\n");
    EXPECT_EQ(rec.count(), 0u);
    EXPECT_FALSE(shell->closed());
}

TEST(DataPump, JoinsSplitCharacters) {
    auto shell = std::make_shared<FakeShell>();
    FakeShellChannel channel(shell);
    DeliveryQueue q;
    EndRecorder rec;

    shell->feed("caf\xC3");
    shell->feed("\xA9");
    DataPump pump(channel, q, 5ms, rec.callback());
    pump.start();

    ASSERT_TRUE(wait_until([&] { return q.last_seq() >= 2; }));
    pump.request_stop();
    pump.join();
    EXPECT_EQ(drain_text(q), "caf\xC3\xA9");
}

TEST(DataPump, EofReportedAfterOutput) {
    auto shell = std::make_shared<FakeShell>();
    FakeShellChannel channel(shell);
    DeliveryQueue q;
    EndRecorder rec;

    shell->feed("logout\r\n");
    shell->end_of_stream();
    DataPump pump(channel, q, 5ms, rec.callback());
    pump.start();

    ASSERT_TRUE(wait_until([&] { return rec.count() == 1; }));
    pump.join();
    EXPECT_EQ(drain_text(q), "logout\r\n");
    std::lock_guard<std::mutex> lock(rec.m);
    EXPECT_EQ(rec.ends[0].first, ChannelEnd::RemoteClosed);
}

TEST(DataPump, ReadErrorReported) {
    auto shell = std::make_shared<FakeShell>();
    FakeShellChannel channel(shell);
    DeliveryQueue q;
    EndRecorder rec;

    DataPump pump(channel, q, 5ms, rec.callback());
    pump.start();
    shell->fail_reads("socket reset");

    ASSERT_TRUE(wait_until([&] { return rec.count() == 1; }));
    pump.join();
    std::lock_guard<std::mutex> lock(rec.m);
    EXPECT_EQ(rec.ends[0].first, ChannelEnd::Error);
    EXPECT_NE(rec.ends[0].second.find("socket reset"), std::string::npos);
}

TEST(DataPump, NothingPushedAfterStop) {
    auto shell = std::make_shared<FakeShell>();
    FakeShellChannel channel(shell);
    DeliveryQueue q;
    EndRecorder rec;

    DataPump pump(channel, q, 5ms, rec.callback());
    pump.start();
    shell->feed("before");
    ASSERT_TRUE(wait_until([&] { return q.last_seq() >= 1; }));

    pump.request_stop();
    uint64_t seq_at_stop = q.last_seq();
    shell->feed("after");
    std::this_thread::sleep_for(50ms);
    pump.join();

    EXPECT_EQ(q.last_seq(), seq_at_stop);
    EXPECT_EQ(pump.chunks_pushed(), seq_at_stop);
}

TEST(DataPump, BurstLargerThanBuffer) {
    auto shell = std::make_shared<FakeShell>();
    FakeShellChannel channel(shell);
    DeliveryQueue q;
    EndRecorder rec;

    std::string big(20000, 'x');
    shell->feed(big);
    DataPump pump(channel, q, 5ms, rec.callback());
    pump.start();

    std::string got;
    ASSERT_TRUE(wait_until([&] {
        got += drain_text(q);
        return got.size() == big.size();
    }));
    pump.request_stop();
    pump.join();
    EXPECT_EQ(got, big);
}
