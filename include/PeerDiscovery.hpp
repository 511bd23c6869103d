#ifndef LANTEXT_PEER_DISCOVERY_HPP
#define LANTEXT_PEER_DISCOVERY_HPP

#include "Config.hpp"
#include "Frame.hpp"
#include "PeerTable.hpp"
#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lantext {

    using udp = boost::asio::ip::udp;

    /**
     * UDP presence protocol. Announces this peer's id and messaging port on an interval and
     * records the announcements of other peers in a PeerTable.
     *
     * Both loops (announce and listen) are asynchronous chains driven by one background
     * thread; stop() closes the socket and cancels the timer so both end promptly.
     */
    class PeerDiscovery {
        public:
            using PeerDiscoveredCallback =
                std::function<void(const std::string& peerId, const std::string& address, uint16_t port)>;

            PeerDiscovery(const std::string& peerId, uint16_t listeningPort, const NodeConfig& config = NodeConfig());
            ~PeerDiscovery();

            PeerDiscovery(const PeerDiscovery&) = delete;
            PeerDiscovery& operator=(const PeerDiscovery&) = delete;

            /**
             * Binds the discovery socket (broadcast + address reuse) and starts both loops.
             * Calling it while running does nothing.
             *
             * @throws boost::system::system_error if the socket cannot be opened or bound.
             */
            void start();

            /**
             * Stops both loops, closes the socket and joins the background thread.
             * Safe to call more than once.
             */
            void stop();

            bool isRunning() const;

            /**
             * Snapshot of known peers after evicting stale records. Call it right before
             * resolving a peer id for a send; records are not cached elsewhere.
             */
            PeerMap getPeers();

            /// Invoked once per newly seen peer id, on the discovery thread.
            void setPeerDiscoveredHandler(PeerDiscoveredCallback cb);

            /// Adds a unicast (or extra broadcast) destination for announcements.
            void addAnnounceTarget(const std::string& host, uint16_t port);

            /// Sends an announcement now instead of waiting for the next interval.
            void announceNow();

            /// Port the discovery socket is bound to (useful when configured as 0).
            uint16_t localPort() const;

            const std::string& peerId() const { return selfId; }

            // Call before start()
            void setListeningPort(uint16_t port);
            void setBroadcastInterval(std::chrono::milliseconds interval);
            void setStaleThreshold(std::chrono::milliseconds threshold);

        private:
            void scheduleAnnounce();
            void sendAnnouncement();
            void doReceive();
            void handleDatagram(const udp::endpoint& sender, size_t length);
            std::vector<udp::endpoint> resolveTargets();

            std::string selfId;
            uint16_t listeningPort;
            uint16_t bindPort;

            boost::asio::io_context io;
            udp::socket sock;
            boost::asio::steady_timer announceTimer;
            std::thread ioThread;

            PeerTable table;
            PeerDiscoveredCallback onPeerDiscovered;

            std::array<uint8_t, MAX_DATAGRAM_SIZE> recvBuf{};
            udp::endpoint senderEndpoint;
            std::vector<uint8_t> announcement;

            mutable std::mutex targetMtx;
            std::vector<AnnounceTarget> targets;
            std::chrono::milliseconds broadcastInterval;

            std::atomic<bool> running{false};
            std::atomic<bool> broadcastErrorLogged{false};
            std::atomic<uint16_t> boundPort{0};
    };

} // namespace lantext

#endif // LANTEXT_PEER_DISCOVERY_HPP
