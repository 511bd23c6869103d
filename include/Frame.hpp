#ifndef LANTEXT_FRAME_HPP
#define LANTEXT_FRAME_HPP

#include "Types.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lantext {

    // ============================================================
    //  FRAME TYPES
    // ============================================================
    enum class FrameType : uint8_t {
        TEXT_MESSAGE   = 1,
        FILE_REQUEST   = 2,
        FILE_ACCEPT    = 3,
        FILE_REJECT    = 4,
        FILE_CHUNK     = 5,
        FILE_COMPLETE  = 6,
        FILE_ERROR     = 7,
        PEER_DISCOVERY = 8
    };

    /**
     * Raised by the decoding functions when bytes do not form a valid frame: truncated
     * length prefix, short payload, oversized declared length, unparsable JSON, missing
     * fields or an unknown type.
     */
    class MalformedFrame : public std::runtime_error {
    public:
        explicit MalformedFrame(const std::string& what) : std::runtime_error(what) {}
    };

    // ============================================================
    //  FRAME STRUCTURE
    // ============================================================

    /**
     * One wire unit. `type` and `from` are always present; the remaining fields are only
     * meaningful for the frame types noted beside them.
     */
    struct Frame {
        FrameType type = FrameType::TEXT_MESSAGE;
        std::string from;

        std::string message;        // TEXT_MESSAGE
        std::string fileId;         // FILE_*
        std::string filename;       // FILE_REQUEST
        uint64_t filesize = 0;      // FILE_REQUEST
        std::string savePath;       // FILE_ACCEPT (omitted from the wire when empty)
        uint64_t chunkNum = 0;      // FILE_CHUNK
        uint64_t totalChunks = 0;   // FILE_COMPLETE
        std::string error;          // FILE_ERROR
        std::string peerId;         // PEER_DISCOVERY
        uint16_t port = 0;          // PEER_DISCOVERY
    };

    // ============================================================
    //  FACTORIES
    // ============================================================
    Frame makeTextMessage(const std::string& from, const std::string& text);
    Frame makeFileRequest(const std::string& from, const std::string& fileId,
                          const std::string& filename, uint64_t filesize);
    Frame makeFileResponse(const std::string& from, const std::string& fileId,
                           bool accepted, const std::string& savePath = "");
    Frame makeFileChunk(const std::string& from, const std::string& fileId, uint64_t chunkNum);
    Frame makeFileComplete(const std::string& from, const std::string& fileId, uint64_t totalChunks);
    Frame makeFileError(const std::string& from, const std::string& fileId, const std::string& error);
    Frame makePeerDiscovery(const std::string& peerId, uint16_t port);

    // ============================================================
    //  LENGTH PREFIX
    // ============================================================

    /** Writes `value` as 4 big-endian bytes into `out`. */
    void writeLengthPrefix(uint32_t value, uint8_t* out);

    /** Reads 4 big-endian bytes from `in`. */
    uint32_t readLengthPrefix(const uint8_t* in);

    // ============================================================
    //  ENCODING / DECODING
    // ============================================================

    /** Serializes only the JSON payload of a frame (no length prefix). */
    std::vector<uint8_t> serializeFramePayload(const Frame& frame);

    /**
     * Parses a JSON payload into a Frame.
     * @throws MalformedFrame on parse errors, missing mandatory fields or unknown types.
     */
    Frame parseFramePayload(const uint8_t* data, size_t size);
    Frame parseFramePayload(const std::vector<uint8_t>& payload);

    /** Encodes a frame as [4-byte length][payload]. */
    std::vector<uint8_t> encodeFrame(const Frame& frame);

    /**
     * Encodes a chunk descriptor followed by its raw bytes segment:
     * [len][descriptor JSON][len][raw bytes].
     */
    std::vector<uint8_t> encodeChunkFrame(const Frame& descriptor, const uint8_t* data, size_t size);

    /**
     * Decodes one length-prefixed frame from the start of `bytes`.
     *
     * @param bytes Buffer beginning with a length prefix.
     * @param maxPayload Largest accepted declared length.
     * @param consumed If not null, receives the number of bytes the frame occupied.
     * @throws MalformedFrame if the prefix is truncated, the payload is shorter than
     * declared, the declared length exceeds `maxPayload` or the payload does not parse.
     */
    Frame decodeFrame(const std::vector<uint8_t>& bytes,
                      size_t maxPayload = MAX_CONTROL_FRAME_SIZE,
                      size_t* consumed = nullptr);

    /** Converts a FrameType to its wire name (also used in logs) */
    std::string frameTypeToString(FrameType type);

    /** Inverse of frameTypeToString; empty for unknown names */
    std::optional<FrameType> frameTypeFromString(const std::string& name);

    /** Control frames close their connection after dispatch; only FILE_CHUNK keeps it open */
    bool isTerminalFrame(FrameType type);

} // namespace lantext

#endif // LANTEXT_FRAME_HPP
