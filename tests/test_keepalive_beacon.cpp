#include <gtest/gtest.h>
#include <managers/keepalive_beacon.hpp>
#include <atomic>
#include "fake_ssh.hpp"

using namespace std::chrono_literals;

TEST(KeepaliveBeacon, SendsProbesEachInterval) {
    auto shell = std::make_shared<FakeShell>();
    FakeShellChannel channel(shell);
    std::atomic<int> ends{0};

    KeepaliveBeacon beacon(channel, 10ms, " \n",
                           [&](ChannelEnd, const std::string&, StopSignal&) { ++ends; });
    beacon.start();
    ASSERT_TRUE(wait_until([&] { return shell->write_count() >= 3; }));
    beacon.request_stop();
    beacon.join();

    for (const auto& w : shell->writes()) EXPECT_EQ(w, " \n");
    EXPECT_EQ(beacon.probes_sent(), shell->write_count());
    EXPECT_EQ(ends.load(), 0);
}

TEST(KeepaliveBeacon, NoProbeBeforeFirstInterval) {
    auto shell = std::make_shared<FakeShell>();
    FakeShellChannel channel(shell);

    KeepaliveBeacon beacon(channel, 10s, " \n", nullptr);
    beacon.start();
    std::this_thread::sleep_for(30ms);
    beacon.request_stop();
    beacon.join();
    EXPECT_EQ(shell->write_count(), 0u);
}

TEST(KeepaliveBeacon, FailureReportedOnceAndEnds) {
    auto shell = std::make_shared<FakeShell>();
    FakeShellChannel channel(shell);
    shell->fail_writes(true);

    std::mutex m;
    std::vector<std::pair<ChannelEnd, std::string>> ends;
    KeepaliveBeacon beacon(channel, 5ms, " \n",
                           [&](ChannelEnd end, const std::string& reason, StopSignal&) {
                               std::lock_guard<std::mutex> lock(m);
                               ends.emplace_back(end, reason);
                           });
    beacon.start();
    ASSERT_TRUE(wait_until([&] {
        std::lock_guard<std::mutex> lock(m);
        return !ends.empty();
    }));
    std::this_thread::sleep_for(40ms);
    beacon.join();

    std::lock_guard<std::mutex> lock(m);
    ASSERT_EQ(ends.size(), 1u);
    EXPECT_EQ(ends[0].first, ChannelEnd::Error);
    EXPECT_NE(ends[0].second.find("keepalive"), std::string::npos);
    EXPECT_EQ(beacon.probes_sent(), 0u);
}

TEST(KeepaliveBeacon, NoProbeAfterStop) {
    auto shell = std::make_shared<FakeShell>();
    FakeShellChannel channel(shell);

    KeepaliveBeacon beacon(channel, 5ms, " \n", nullptr);
    beacon.start();
    ASSERT_TRUE(wait_until([&] { return shell->write_count() >= 1; }));
    beacon.request_stop();
    size_t at_stop = shell->write_count();
    std::this_thread::sleep_for(40ms);
    EXPECT_EQ(shell->write_count(), at_stop);
    beacon.join();
}
