#include <gtest/gtest.h>
#include "PeerTable.hpp"
#include <chrono>
#include <thread>
#include <type_traits>

using namespace lantext;
using namespace std;

// -----------------------
// HELPER FUNCTIONS
// -----------------------
static PeerRecord makeRecord(const string& id, const string& address = "127.0.0.1", uint16_t port = 5000,
                             chrono::steady_clock::time_point seen = chrono::steady_clock::now()) {
    PeerRecord r;
    r.peerId = id;
    r.address = address;
    r.port = port;
    r.lastSeen = seen;
    return r;
}

// -----------------------
// BASIC TESTS
// -----------------------
TEST(PeerTableTest, UpsertReportsNewPeersOnce) {
    PeerTable table;
    EXPECT_TRUE(table.upsert(makeRecord("a")));
    EXPECT_FALSE(table.upsert(makeRecord("a")));
    EXPECT_TRUE(table.upsert(makeRecord("b")));
    EXPECT_EQ(table.getPeers().size(), 2u);
}

TEST(PeerTableTest, UpsertKeepsLatestAddressOnly) {
    PeerTable table;
    table.upsert(makeRecord("a", "10.0.0.1", 5000));
    table.upsert(makeRecord("a", "10.0.0.2", 6000));

    auto peers = table.getPeers();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers["a"].address, "10.0.0.2");
    EXPECT_EQ(peers["a"].port, 6000);
    EXPECT_EQ(peers["a"].endpoint(), "10.0.0.2:6000");
}

TEST(PeerTableTest, InvalidRecordsRejected) {
    PeerTable table;
    EXPECT_FALSE(table.upsert(makeRecord("")));
    EXPECT_FALSE(table.upsert(makeRecord("a", "")));
    EXPECT_FALSE(table.upsert(makeRecord("a", "127.0.0.1", 0)));
    EXPECT_EQ(table.size(), 0u);
}

TEST(PeerTableTest, ClearDropsEverything) {
    PeerTable table;
    table.upsert(makeRecord("a"));
    table.upsert(makeRecord("b"));
    table.clear();
    EXPECT_EQ(table.size(), 0u);
    EXPECT_TRUE(table.getPeers().empty());
}

// -----------------------
// STALENESS
// -----------------------
TEST(PeerTableTest, DefaultThresholdIsThirtySeconds) {
    PeerTable table;
    EXPECT_EQ(table.staleThreshold(), chrono::milliseconds(30000));

    auto now = chrono::steady_clock::now();
    table.upsert(makeRecord("fresh", "127.0.0.1", 5000, now - chrono::seconds(29)));
    table.upsert(makeRecord("stale", "127.0.0.1", 5001, now - chrono::seconds(31)));

    EXPECT_EQ(table.size(), 2u); // eviction happens on read only
    auto peers = table.getPeers();
    EXPECT_EQ(peers.count("fresh"), 1u);
    EXPECT_EQ(peers.count("stale"), 0u);
    EXPECT_EQ(table.size(), 1u);
}

TEST(PeerTableTest, ShortThresholdEvictsAfterSilence) {
    PeerTable table(chrono::milliseconds(50));
    table.upsert(makeRecord("a"));
    EXPECT_EQ(table.getPeers().size(), 1u);

    this_thread::sleep_for(chrono::milliseconds(120));
    EXPECT_TRUE(table.getPeers().empty());
    EXPECT_EQ(table.size(), 0u);
}

TEST(PeerTableTest, StalenessUsesMonotonicClock) {
    static_assert(is_same<decltype(PeerRecord::lastSeen), chrono::steady_clock::time_point>::value,
                  "peer age must not follow wall clock changes");

    PeerTable table;
    PeerRecord r = makeRecord("a");
    EXPECT_LE(chrono::steady_clock::now() - r.lastSeen, chrono::seconds(1));
    table.upsert(r);
    EXPECT_EQ(table.getPeers().count("a"), 1u);
}

TEST(PeerTableTest, RefreshKeepsPeerAlive) {
    PeerTable table(chrono::milliseconds(100));
    table.upsert(makeRecord("a"));
    this_thread::sleep_for(chrono::milliseconds(60));
    table.upsert(makeRecord("a"));
    this_thread::sleep_for(chrono::milliseconds(60));
    EXPECT_EQ(table.getPeers().size(), 1u);
}

// -----------------------
// CONCURRENCY
// -----------------------
TEST(PeerTableTest, ConcurrentUpsertsAndReads) {
    PeerTable table;
    vector<thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&table, t] {
            for (int i = 0; i < 200; ++i) {
                table.upsert(makeRecord("p" + to_string(t) + "_" + to_string(i % 50)));
                table.getPeers();
            }
        });
    }
    for (auto& w : writers) w.join();
    EXPECT_EQ(table.getPeers().size(), 200u);
}
