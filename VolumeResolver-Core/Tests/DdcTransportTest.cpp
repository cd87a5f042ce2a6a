#include <gtest/gtest.h>
#include "Core/Ddc/DdcTransport.hpp"
#include "Core/Ddc/RetryPolicy.hpp"
#include "Core/Ddc/ServiceLookup.hpp"
#include "Fakes.hpp"

namespace {

using testing_fakes::FakeDdcTransport;
using testing_fakes::MakeReply;
using testing_fakes::SleepLog;
using std::chrono::milliseconds;

TEST(RetryPolicyTest, StopsAtFirstSuccess) {
    std::vector<milliseconds> slept;
    int calls = 0;
    const bool ok = RunWithRetry(RetryPolicy{ 4, milliseconds(20), false },
        [&](milliseconds d) { slept.push_back(d); },
        [&](int attempt) { ++calls; return attempt == 2; });
    EXPECT_TRUE(ok);
    EXPECT_EQ(calls, 3);
    ASSERT_EQ(slept.size(), 2u);
    EXPECT_EQ(slept[0], milliseconds(20));
}

TEST(RetryPolicyTest, BoundedAndDelayBeforeFirst) {
    std::vector<milliseconds> slept;
    int calls = 0;
    const bool ok = RunWithRetry(RetryPolicy{ 3, milliseconds(10), true },
        [&](milliseconds d) { slept.push_back(d); },
        [&](int) { ++calls; return false; });
    EXPECT_FALSE(ok);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(slept.size(), 3u);
}

TEST(ServiceLookupTest, FallsBackWhenFirstPortHasNoService) {
    std::vector<int> opened;
    const int svc = OpenFirstService<int, int>({
        [] { return 11; },
        [] { return 0; },
        [] { return 22; },
    }, [&](int port) { opened.push_back(port); return port == 22 ? 220 : 0; });
    EXPECT_EQ(svc, 220);
    ASSERT_EQ(opened.size(), 2u);
    EXPECT_EQ(opened[0], 11);
    EXPECT_EQ(opened[1], 22);
}

TEST(ServiceLookupTest, FirstWorkingPortSkipsTheRest) {
    int lookups = 0;
    const int svc = OpenFirstService<int, int>({
        [&] { ++lookups; return 5; },
        [&] { ++lookups; return 6; },
    }, [](int port) { return port * 10; });
    EXPECT_EQ(svc, 50);
    EXPECT_EQ(lookups, 1);

    EXPECT_EQ((OpenFirstService<int, int>({ [] { return 0; } }, [](int) { return 1; })), 0);
}

TEST(DdcTransportTest, InvalidRepliesAreRetriedNotZeroed) {
    FakeDdcTransport t;
    t.current = 70;
    auto corrupt = MakeReply(0, 100);
    corrupt[9] ^= 0x01;
    t.queued.push_back(corrupt);
    t.queued.push_back(std::nullopt);

    auto v = t.readVolume();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->current, 70);
    EXPECT_EQ(v->max, 100);
    EXPECT_EQ(t.reads, 3);
    EXPECT_EQ(t.sleeps->calls.size(), 2u);
}

TEST(DdcTransportTest, ReadGivesUpAfterBound) {
    FakeDdcTransport t;
    t.online = false;
    EXPECT_FALSE(t.readVolume().has_value());
    EXPECT_EQ(t.reads, 3);
    EXPECT_FALSE(t.isSupported());
}

TEST(DdcTransportTest, WriteIsIssuedTwice) {
    FakeDdcTransport t;
    ASSERT_TRUE(t.writeVolume(30, 100));
    ASSERT_EQ(t.sent.size(), 2u);
    EXPECT_EQ(t.sent[0], 30);
    EXPECT_EQ(t.sent[1], 30);
    EXPECT_EQ(t.current, 30);
}

TEST(DdcTransportTest, DroppedFirstWriteStillSucceeds) {
    FakeDdcTransport t;
    t.dropWrites = 1;
    EXPECT_TRUE(t.writeVolume(20, 100));
    EXPECT_EQ(t.sent.size(), 2u);
    EXPECT_EQ(t.current, 20);
}

TEST(DdcTransportTest, WriteClampsToMax) {
    FakeDdcTransport t;
    ASSERT_TRUE(t.writeVolume(500, 80));
    EXPECT_EQ(t.sent.back(), 80);
}

TEST(DdcTransportTest, RejectedWritesRetryUpToBound) {
    FakeDdcTransport t;
    t.acceptWrites = false;
    EXPECT_FALSE(t.writeVolume(10, 100));
    EXPECT_EQ(t.sent.size(), 3u * DdcVolumeTransport::kWriteCycles);
}

}  // namespace
