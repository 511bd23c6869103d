#ifndef LANTEXT_PEER_TABLE_HPP
#define LANTEXT_PEER_TABLE_HPP

#include "Peer.hpp"
#include "Types.hpp"
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lantext {

    using PeerMap = std::unordered_map<std::string, PeerRecord>;

    /**
     * Thread-safe table of discovered peers keyed by peer id. Records older than the stale
     * threshold are evicted lazily whenever the table is read.
     */
    class PeerTable {
        public:
            explicit PeerTable(std::chrono::milliseconds staleThreshold = STALE_THRESHOLD);
            ~PeerTable() = default;

            /**
             * Inserts or overwrites the record for `record.peerId`.
             * @return true if the id was not present before (a newly seen peer).
             */
            bool upsert(const PeerRecord& record);

            /**
             * Evicts stale records and returns a copy of what remains.
             */
            PeerMap getPeers();

            /**
             * Number of records currently held, stale ones included.
             */
            size_t size() const;

            void clear();

            void setStaleThreshold(std::chrono::milliseconds threshold);
            std::chrono::milliseconds staleThreshold() const;

        private:
            size_t evictStaleLocked(std::chrono::steady_clock::time_point now);

            mutable std::mutex mtx;
            PeerMap peers;
            std::chrono::milliseconds threshold;
    };

} // namespace lantext

#endif // LANTEXT_PEER_TABLE_HPP
