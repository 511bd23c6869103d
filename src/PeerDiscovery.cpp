#include "PeerDiscovery.hpp"
#include <iostream>

namespace lantext {

    PeerDiscovery::PeerDiscovery(const std::string& peerId, uint16_t listeningPort, const NodeConfig& config)
        : selfId(peerId),
          listeningPort(listeningPort),
          bindPort(config.discoveryPort),
          io(),
          sock(io),
          announceTimer(io),
          table(config.staleThreshold),
          targets(config.announceTargets),
          broadcastInterval(config.broadcastInterval) {}

    PeerDiscovery::~PeerDiscovery() {
        stop();
    }

    void PeerDiscovery::start() {
        if (running.exchange(true)) return;

        try {
            io.restart();
            sock.open(udp::v4());
            sock.set_option(boost::asio::socket_base::reuse_address(true));
            sock.set_option(boost::asio::socket_base::broadcast(true));
            sock.bind(udp::endpoint(boost::asio::ip::address_v4::any(), bindPort));
            boundPort.store(sock.local_endpoint().port());
        } catch (const boost::system::system_error& e) {
            std::cerr << "PeerDiscovery: cannot bind UDP port " << bindPort << ": " << e.what() << std::endl;
            boost::system::error_code ec;
            sock.close(ec);
            running.store(false);
            throw;
        }

        announcement = encodeFrame(makePeerDiscovery(selfId, listeningPort));
        broadcastErrorLogged.store(false);

        doReceive();
        sendAnnouncement();
        scheduleAnnounce();

        ioThread = std::thread([this] {
            try {
                io.run();
            } catch (const std::exception& e) {
                std::cerr << "PeerDiscovery IO context error: " << e.what() << std::endl;
            }
        });
    }

    void PeerDiscovery::stop() {
        if (!running.exchange(false)) return;

        // Socket and timer belong to the io thread; close them there
        boost::asio::post(io, [this] {
            boost::system::error_code ec;
            announceTimer.cancel();
            sock.close(ec);
        });

        if (ioThread.joinable()) {
            ioThread.join();
        }

        // Drain whatever the io thread left behind so a restart starts clean
        io.restart();
        io.poll();
        boost::system::error_code ec;
        sock.close(ec);
    }

    bool PeerDiscovery::isRunning() const {
        return running.load();
    }

    PeerMap PeerDiscovery::getPeers() {
        return table.getPeers();
    }

    void PeerDiscovery::setPeerDiscoveredHandler(PeerDiscoveredCallback cb) {
        onPeerDiscovered = std::move(cb);
    }

    void PeerDiscovery::addAnnounceTarget(const std::string& host, uint16_t port) {
        std::lock_guard<std::mutex> lock(targetMtx);
        targets.push_back(AnnounceTarget{host, port});
    }

    void PeerDiscovery::announceNow() {
        if (!running.load()) return;
        boost::asio::post(io, [this] {
            if (running.load()) sendAnnouncement();
        });
    }

    uint16_t PeerDiscovery::localPort() const {
        return boundPort.load();
    }

    void PeerDiscovery::setListeningPort(uint16_t port) {
        listeningPort = port;
    }

    void PeerDiscovery::setBroadcastInterval(std::chrono::milliseconds interval) {
        broadcastInterval = interval;
    }

    void PeerDiscovery::setStaleThreshold(std::chrono::milliseconds threshold) {
        table.setStaleThreshold(threshold);
    }

    void PeerDiscovery::scheduleAnnounce() {
        announceTimer.expires_after(broadcastInterval);
        announceTimer.async_wait([this](const boost::system::error_code& ec) {
            if (ec || !running.load()) return;
            sendAnnouncement();
            scheduleAnnounce();
        });
    }

    std::vector<udp::endpoint> PeerDiscovery::resolveTargets() {
        std::vector<AnnounceTarget> snapshot;
        {
            std::lock_guard<std::mutex> lock(targetMtx);
            snapshot = targets;
        }

        std::vector<udp::endpoint> endpoints;
        endpoints.reserve(snapshot.size());

        for (const auto& target : snapshot) {
            boost::system::error_code ec;
            auto address = boost::asio::ip::make_address(target.host, ec);
            if (!ec) {
                endpoints.emplace_back(address, target.port);
                continue;
            }

            udp::resolver resolver(io);
            auto results = resolver.resolve(udp::v4(), target.host, std::to_string(target.port), ec);
            if (ec || results.empty()) {
                std::cerr << "PeerDiscovery: cannot resolve announce target " << target.host << std::endl;
                continue;
            }
            endpoints.push_back(results.begin()->endpoint());
        }

        return endpoints;
    }

    void PeerDiscovery::sendAnnouncement() {
        for (const auto& endpoint : resolveTargets()) {
            sock.async_send_to(boost::asio::buffer(announcement), endpoint,
                [this](const boost::system::error_code& ec, std::size_t) {
                    if (!ec || ec == boost::asio::error::operation_aborted) return;
                    // Broadcast may be unsupported on this interface; listening still works
                    if (running.load() && !broadcastErrorLogged.exchange(true)) {
                        std::cerr << "PeerDiscovery: broadcast not available (" << ec.message()
                                  << "). Discovery will still work via listening." << std::endl;
                    }
                });
        }
    }

    void PeerDiscovery::doReceive() {
        sock.async_receive_from(boost::asio::buffer(recvBuf), senderEndpoint,
            [this](const boost::system::error_code& ec, std::size_t length) {
                if (ec) {
                    if (ec == boost::asio::error::operation_aborted || !running.load()) return;
                    std::cerr << "PeerDiscovery: error listening for peers: " << ec.message() << std::endl;
                } else {
                    handleDatagram(senderEndpoint, length);
                }

                if (running.load()) doReceive();
            });
    }

    void PeerDiscovery::handleDatagram(const udp::endpoint& sender, size_t length) {
        std::vector<uint8_t> datagram(recvBuf.begin(), recvBuf.begin() + length);

        Frame frame;
        try {
            frame = decodeFrame(datagram);
        } catch (const MalformedFrame&) {
            return; // not ours, or garbage
        }

        if (frame.type != FrameType::PEER_DISCOVERY) return;
        if (frame.peerId == selfId) return;

        PeerRecord record;
        record.peerId = frame.peerId;
        record.address = sender.address().to_string();
        record.port = frame.port;
        record.lastSeen = std::chrono::steady_clock::now();

        if (!table.upsert(record)) return;

        std::cout << "PeerDiscovery: discovered " << record.peerId << " at " << record.endpoint() << std::endl;

        if (onPeerDiscovered) {
            try {
                onPeerDiscovered(record.peerId, record.address, record.port);
            } catch (const std::exception& e) {
                std::cerr << "Error in peer discovered handler: " << e.what() << std::endl;
            }
        }
    }

} // namespace lantext
