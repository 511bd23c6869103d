#include <gtest/gtest.h>
#include "PeerDiscovery.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

using namespace lantext;
using namespace std;

// -----------------------
// HELPER FUNCTIONS
// -----------------------
static NodeConfig loopbackDiscoveryConfig() {
    NodeConfig config;
    config.discoveryPort = 0;               // ephemeral, tests may run in parallel
    config.announceTargets.clear();         // no broadcast route needed
    config.broadcastInterval = chrono::milliseconds(100);
    return config;
}

static bool waitUntil(const function<bool()>& done, chrono::milliseconds limit = chrono::milliseconds(3000)) {
    auto deadline = chrono::steady_clock::now() + limit;
    while (chrono::steady_clock::now() < deadline) {
        if (done()) return true;
        this_thread::sleep_for(chrono::milliseconds(20));
    }
    return done();
}

static void sendDatagram(uint16_t port, const vector<uint8_t>& bytes) {
    boost::asio::io_context io;
    boost::asio::ip::udp::socket sock(io, boost::asio::ip::udp::v4());
    sock.send_to(boost::asio::buffer(bytes),
                 boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
}

// -----------------------
// BASIC TESTS
// -----------------------
TEST(PeerDiscoveryTest, StartBindsAndStopIsIdempotent) {
    PeerDiscovery discovery("self", 5000, loopbackDiscoveryConfig());
    EXPECT_FALSE(discovery.isRunning());

    discovery.start();
    EXPECT_TRUE(discovery.isRunning());
    EXPECT_NE(discovery.localPort(), 0);
    discovery.start(); // no effect while running

    discovery.stop();
    EXPECT_FALSE(discovery.isRunning());
    discovery.stop();
}

TEST(PeerDiscoveryTest, RecordsAnnouncedPeerOnce) {
    PeerDiscovery discovery("self", 5000, loopbackDiscoveryConfig());
    atomic<int> discovered{0};
    string seenAddress;
    uint16_t seenPort = 0;
    discovery.setPeerDiscoveredHandler([&](const string& id, const string& address, uint16_t port) {
        if (id == "other") {
            seenAddress = address;
            seenPort = port;
            discovered++;
        }
    });
    discovery.start();

    auto announcement = encodeFrame(makePeerDiscovery("other", 6000));
    sendDatagram(discovery.localPort(), announcement);
    ASSERT_TRUE(waitUntil([&] { return discovered.load() == 1; }));

    sendDatagram(discovery.localPort(), announcement);
    this_thread::sleep_for(chrono::milliseconds(200));
    EXPECT_EQ(discovered.load(), 1);

    auto peers = discovery.getPeers();
    ASSERT_EQ(peers.count("other"), 1u);
    EXPECT_EQ(peers["other"].port, 6000);
    EXPECT_EQ(peers["other"].address, "127.0.0.1");
    EXPECT_EQ(seenAddress, "127.0.0.1");
    EXPECT_EQ(seenPort, 6000);

    discovery.stop();
}

TEST(PeerDiscoveryTest, LatestAnnouncementWins) {
    PeerDiscovery discovery("self", 5000, loopbackDiscoveryConfig());
    discovery.start();

    sendDatagram(discovery.localPort(), encodeFrame(makePeerDiscovery("other", 6000)));
    ASSERT_TRUE(waitUntil([&] { return discovery.getPeers().count("other") == 1; }));

    sendDatagram(discovery.localPort(), encodeFrame(makePeerDiscovery("other", 6001)));
    EXPECT_TRUE(waitUntil([&] { return discovery.getPeers()["other"].port == 6001; }));

    discovery.stop();
}

// -----------------------
// IGNORED DATAGRAMS
// -----------------------
TEST(PeerDiscoveryTest, IgnoresSelfMalformedAndNonDiscoveryFrames) {
    PeerDiscovery discovery("self", 5000, loopbackDiscoveryConfig());
    discovery.start();
    uint16_t port = discovery.localPort();

    sendDatagram(port, encodeFrame(makePeerDiscovery("self", 5000)));
    sendDatagram(port, {0x00, 0x00, 0x00, 0x05, 'h', 'e', 'l', 'l', 'o'});
    sendDatagram(port, {0x01});
    sendDatagram(port, encodeFrame(makeTextMessage("intruder", "hi")));
    sendDatagram(port, encodeFrame(makePeerDiscovery("marker", 7000)));

    // datagrams from one sender arrive in order on loopback
    ASSERT_TRUE(waitUntil([&] { return discovery.getPeers().count("marker") == 1; }));
    auto peers = discovery.getPeers();
    EXPECT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers.count("self"), 0u);
    EXPECT_EQ(peers.count("intruder"), 0u);

    discovery.stop();
}

TEST(PeerDiscoveryTest, StalePeersEvicted) {
    NodeConfig config = loopbackDiscoveryConfig();
    config.staleThreshold = chrono::milliseconds(150);
    PeerDiscovery discovery("self", 5000, config);
    discovery.start();

    sendDatagram(discovery.localPort(), encodeFrame(makePeerDiscovery("other", 6000)));
    ASSERT_TRUE(waitUntil([&] { return discovery.getPeers().size() == 1; }));

    this_thread::sleep_for(chrono::milliseconds(300));
    EXPECT_TRUE(discovery.getPeers().empty());

    discovery.stop();
}

// -----------------------
// TWO SERVICES
// -----------------------
TEST(PeerDiscoveryTest, UnicastDiscoveryIsSymmetric) {
    PeerDiscovery a("peer-a", 5001, loopbackDiscoveryConfig());
    PeerDiscovery b("peer-b", 5002, loopbackDiscoveryConfig());
    a.start();
    b.start();

    a.addAnnounceTarget("127.0.0.1", b.localPort());
    b.addAnnounceTarget("127.0.0.1", a.localPort());
    a.announceNow();
    b.announceNow();

    ASSERT_TRUE(waitUntil([&] {
        return a.getPeers().count("peer-b") == 1 && b.getPeers().count("peer-a") == 1;
    }));
    EXPECT_EQ(a.getPeers()["peer-b"].port, 5002);
    EXPECT_EQ(b.getPeers()["peer-a"].port, 5001);

    a.stop();
    b.stop();
}

TEST(PeerDiscoveryTest, RestartAfterStop) {
    PeerDiscovery discovery("self", 5000, loopbackDiscoveryConfig());
    discovery.start();
    discovery.stop();

    discovery.start();
    ASSERT_TRUE(discovery.isRunning());
    sendDatagram(discovery.localPort(), encodeFrame(makePeerDiscovery("other", 6000)));
    EXPECT_TRUE(waitUntil([&] { return discovery.getPeers().count("other") == 1; }));
    discovery.stop();
}
