#ifndef LANTEXT_CONFIG_HPP
#define LANTEXT_CONFIG_HPP

#include "Types.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lantext {

    struct AnnounceTarget {
        std::string host;
        uint16_t port = DISCOVERY_PORT;
    };

    // Runtime settings of one node; defaults are the protocol constants.
    struct NodeConfig {
        std::string peerId;                 // empty: generated on construction
        uint16_t messagingPort = 0;         // 0: assigned by the OS
        uint16_t discoveryPort = DISCOVERY_PORT;
        std::vector<AnnounceTarget> announceTargets{{BROADCAST_ADDRESS, DISCOVERY_PORT}};

        std::chrono::milliseconds broadcastInterval = BROADCAST_INTERVAL;
        std::chrono::milliseconds staleThreshold = STALE_THRESHOLD;
        std::chrono::milliseconds controlTimeout = CONTROL_TIMEOUT;
        std::chrono::milliseconds fileTimeout = FILE_TIMEOUT;

        size_t chunkSize = CHUNK_SIZE;
        size_t maxFramesPerConnection = MAX_FRAMES_PER_CONNECTION;
        size_t ioThreads = DEFAULT_IO_THREADS;
    };

    /**
     * Reads a JSON config file into `config`. Keys absent from the file keep their current
     * value. Recognized keys: peer_id, port, discovery_port, announce_targets
     * ([{"host":..,"port":..}]), broadcast_interval_ms, stale_threshold_ms,
     * control_timeout_ms, file_timeout_ms, chunk_size, max_frames_per_connection, io_threads.
     *
     * @return false if the file cannot be opened or is not a valid config object.
     */
    bool loadNodeConfig(const std::string& path, NodeConfig& config);

} // namespace lantext

#endif // LANTEXT_CONFIG_HPP
