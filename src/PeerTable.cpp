#include "PeerTable.hpp"

namespace lantext {

    PeerTable::PeerTable(std::chrono::milliseconds staleThreshold) : threshold(staleThreshold) {}

    bool PeerTable::upsert(const PeerRecord& record) {
        if (!record.isValid()) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mtx);
        auto it = peers.find(record.peerId);
        if (it != peers.end()) {
            // Only the latest address is kept
            it->second = record;
            return false;
        }

        peers.emplace(record.peerId, record);
        return true;
    }

    PeerMap PeerTable::getPeers() {
        std::lock_guard<std::mutex> lock(mtx);
        evictStaleLocked(std::chrono::steady_clock::now());
        return peers;
    }

    size_t PeerTable::size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return peers.size();
    }

    void PeerTable::clear() {
        std::lock_guard<std::mutex> lock(mtx);
        peers.clear();
    }

    void PeerTable::setStaleThreshold(std::chrono::milliseconds staleThreshold) {
        std::lock_guard<std::mutex> lock(mtx);
        threshold = staleThreshold;
    }

    std::chrono::milliseconds PeerTable::staleThreshold() const {
        std::lock_guard<std::mutex> lock(mtx);
        return threshold;
    }

    size_t PeerTable::evictStaleLocked(std::chrono::steady_clock::time_point now) {
        size_t removed = 0;
        for (auto it = peers.begin(); it != peers.end(); ) {
            if (now - it->second.lastSeen > threshold) {
                it = peers.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

} // namespace lantext
