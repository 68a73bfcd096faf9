#include <gtest/gtest.h>
#include "pomelo/prober.hpp"
#include "test_support.hpp"

using namespace pomelo;
using pomelo::test::addr;
using pomelo::test::runUntil;

TEST(IcmpChecksumTest, Rfc1071Example) {
    const uint8_t data[] = {0x00, 0x01, 0xF2, 0x03, 0xF4, 0xF5, 0xF6, 0xF7};
    EXPECT_EQ(IcmpProber::checksum(data, sizeof(data)), 0x220D);
}

TEST(IcmpChecksumTest, OddLengthAndVerify) {
    uint8_t packet[] = {0x08, 0x00, 0x00, 0x00, 0x12, 0x34, 0x00, 0x01, 'p'};
    uint16_t sum = IcmpProber::checksum(packet, sizeof(packet));
    packet[2] = static_cast<uint8_t>(sum >> 8);
    packet[3] = static_cast<uint8_t>(sum & 0xFF);

    // 填入校验和后再次计算结果为 0
    EXPECT_EQ(IcmpProber::checksum(packet, sizeof(packet)), 0);
}

TEST(ProbeResultTest, Names) {
    EXPECT_STREQ(probeResultName(ProbeResult::Reachable), "reachable");
    EXPECT_STREQ(probeResultName(ProbeResult::Unreachable), "unreachable");
    EXPECT_STREQ(probeResultName(ProbeResult::Indeterminate), "indeterminate");
}

// 原始套接字可能没有权限, 只要求在超时内给出结果
TEST(IcmpProberTest, LoopbackCompletesWithinTimeout) {
    boost::asio::io_context io;
    IcmpProber prober(io);

    for (const char* target : {"127.0.0.1", "::1"}) {
        bool done = false;
        ProbeResult result = ProbeResult::Indeterminate;
        auto start = std::chrono::steady_clock::now();
        prober.asyncProbe(addr(target), std::chrono::milliseconds(200),
                          [&](ProbeResult r) {
                              EXPECT_FALSE(done) << "handler called twice";
                              result = r;
                              done = true;
                          });
        ASSERT_TRUE(runUntil(io, [&] { return done; }, std::chrono::milliseconds(2000)))
            << target;
        EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(1000))
            << target << " " << probeResultName(result);
    }

    auto stats = prober.getStats();
    EXPECT_EQ(stats.probes, 2u);
    EXPECT_EQ(stats.reachable + stats.unreachable + stats.indeterminate, 2u);

    prober.resetStats();
    EXPECT_EQ(prober.getStats().probes, 0u);
}

TEST(FakeProberTest, PostsConfiguredResult) {
    boost::asio::io_context io;
    pomelo::test::FakeProber prober(io);
    prober.set("2001:db8::1", ProbeResult::Reachable);

    std::vector<ProbeResult> results;
    prober.asyncProbe(addr("2001:db8::1"), std::chrono::milliseconds(100),
                      [&](ProbeResult r) { results.push_back(r); });
    prober.asyncProbe(addr("2001:db8::2"), std::chrono::milliseconds(100),
                      [&](ProbeResult r) { results.push_back(r); });
    // 结果异步投递
    EXPECT_TRUE(results.empty());

    ASSERT_TRUE(runUntil(io, [&] { return results.size() == 2; }));
    EXPECT_EQ(results[0], ProbeResult::Reachable);
    EXPECT_EQ(results[1], ProbeResult::Indeterminate);
}
