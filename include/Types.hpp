#ifndef LANTEXT_TYPES_HPP
#define LANTEXT_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <cstddef>

namespace lantext {

    // ============================================================
    //  PROTOCOL CONFIGURATION
    // ============================================================

    // Well-known UDP port every peer listens on for announcements
    inline constexpr uint16_t DISCOVERY_PORT = 37020;
    inline constexpr const char* BROADCAST_ADDRESS = "255.255.255.255";

    inline constexpr std::chrono::milliseconds BROADCAST_INTERVAL{5000};
    inline constexpr std::chrono::milliseconds STALE_THRESHOLD{30000};

    // Framing
    inline constexpr size_t LENGTH_PREFIX_SIZE = 4;             // big-endian uint32
    inline constexpr size_t MAX_CONTROL_FRAME_SIZE = 4096;      // JSON payload limit
    inline constexpr size_t MAX_DATAGRAM_SIZE = LENGTH_PREFIX_SIZE + MAX_CONTROL_FRAME_SIZE;
    inline constexpr size_t CHUNK_SIZE = 8192;                  // 8 KB file blocks
    inline constexpr size_t MAX_CHUNK_SEGMENT_SIZE = 1024 * 1024;
    inline constexpr size_t MAX_FRAMES_PER_CONNECTION = 1000;

    // Timeouts
    inline constexpr std::chrono::milliseconds CONTROL_TIMEOUT{5000};
    inline constexpr std::chrono::milliseconds FILE_TIMEOUT{30000};

    // Identifiers (bytes of randomness, hex-encoded on the wire)
    inline constexpr size_t PEER_ID_BYTES = 4;
    inline constexpr size_t FILE_ID_BYTES = 16;

    // Inbound connections are served by a small pool
    inline constexpr size_t DEFAULT_IO_THREADS = 4;

} // namespace lantext

#endif // LANTEXT_TYPES_HPP
