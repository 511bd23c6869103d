#ifndef LANTEXT_PEER_HPP
#define LANTEXT_PEER_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace lantext {

    struct PeerRecord {
        std::string peerId;
        std::string address;   // ip as observed on the discovery datagram
        uint16_t port = 0;     // TCP messaging port announced by the peer
        // monotonic, so wall clock adjustments never age or revive a peer
        std::chrono::steady_clock::time_point lastSeen = std::chrono::steady_clock::now();

        std::string endpoint() const {
            return address + ":" + std::to_string(port);
        }

        bool isValid() const {
            return !peerId.empty() && !address.empty() && port > 0;
        }
    };

} // namespace lantext

#endif // LANTEXT_PEER_HPP
