#include "Frame.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lantext {

    namespace {

        std::string requireString(const json& object, const char* key) {
            auto it = object.find(key);
            if (it == object.end() || !it->is_string()) {
                throw MalformedFrame(std::string("Missing or invalid field '") + key + "'");
            }
            return it->get<std::string>();
        }

        uint64_t requireUnsigned(const json& object, const char* key) {
            auto it = object.find(key);
            if (it == object.end() || !it->is_number_unsigned()) {
                throw MalformedFrame(std::string("Missing or invalid field '") + key + "'");
            }
            return it->get<uint64_t>();
        }

    } // namespace

    // ------------------------------------------------------------
    // FACTORIES
    // ------------------------------------------------------------
    Frame makeTextMessage(const std::string& from, const std::string& text) {
        Frame frame;
        frame.type = FrameType::TEXT_MESSAGE;
        frame.from = from;
        frame.message = text;
        return frame;
    }

    Frame makeFileRequest(const std::string& from, const std::string& fileId,
                          const std::string& filename, uint64_t filesize) {
        Frame frame;
        frame.type = FrameType::FILE_REQUEST;
        frame.from = from;
        frame.fileId = fileId;
        frame.filename = filename;
        frame.filesize = filesize;
        return frame;
    }

    Frame makeFileResponse(const std::string& from, const std::string& fileId,
                           bool accepted, const std::string& savePath) {
        Frame frame;
        frame.type = accepted ? FrameType::FILE_ACCEPT : FrameType::FILE_REJECT;
        frame.from = from;
        frame.fileId = fileId;
        if (accepted) frame.savePath = savePath;
        return frame;
    }

    Frame makeFileChunk(const std::string& from, const std::string& fileId, uint64_t chunkNum) {
        Frame frame;
        frame.type = FrameType::FILE_CHUNK;
        frame.from = from;
        frame.fileId = fileId;
        frame.chunkNum = chunkNum;
        return frame;
    }

    Frame makeFileComplete(const std::string& from, const std::string& fileId, uint64_t totalChunks) {
        Frame frame;
        frame.type = FrameType::FILE_COMPLETE;
        frame.from = from;
        frame.fileId = fileId;
        frame.totalChunks = totalChunks;
        return frame;
    }

    Frame makeFileError(const std::string& from, const std::string& fileId, const std::string& error) {
        Frame frame;
        frame.type = FrameType::FILE_ERROR;
        frame.from = from;
        frame.fileId = fileId;
        frame.error = error;
        return frame;
    }

    Frame makePeerDiscovery(const std::string& peerId, uint16_t port) {
        Frame frame;
        frame.type = FrameType::PEER_DISCOVERY;
        frame.from = peerId;
        frame.peerId = peerId;
        frame.port = port;
        return frame;
    }

    // ------------------------------------------------------------
    // LENGTH PREFIX (big-endian, independent of host byte order)
    // ------------------------------------------------------------
    void writeLengthPrefix(uint32_t value, uint8_t* out) {
        out[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
        out[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
        out[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
        out[3] = static_cast<uint8_t>(value & 0xFF);
    }

    uint32_t readLengthPrefix(const uint8_t* in) {
        return (static_cast<uint32_t>(in[0]) << 24) |
               (static_cast<uint32_t>(in[1]) << 16) |
               (static_cast<uint32_t>(in[2]) << 8)  |
                static_cast<uint32_t>(in[3]);
    }

    // ------------------------------------------------------------
    // SERIALIZATION
    // ------------------------------------------------------------
    std::vector<uint8_t> serializeFramePayload(const Frame& frame) {
        json object;
        object["type"] = frameTypeToString(frame.type);
        object["from"] = frame.from;

        switch (frame.type) {
            case FrameType::TEXT_MESSAGE:
                object["message"] = frame.message;
                break;
            case FrameType::FILE_REQUEST:
                object["file_id"] = frame.fileId;
                object["filename"] = frame.filename;
                object["filesize"] = frame.filesize;
                break;
            case FrameType::FILE_ACCEPT:
                object["file_id"] = frame.fileId;
                if (!frame.savePath.empty()) object["save_path"] = frame.savePath;
                break;
            case FrameType::FILE_REJECT:
                object["file_id"] = frame.fileId;
                break;
            case FrameType::FILE_CHUNK:
                object["file_id"] = frame.fileId;
                object["chunk_num"] = frame.chunkNum;
                break;
            case FrameType::FILE_COMPLETE:
                object["file_id"] = frame.fileId;
                object["total_chunks"] = frame.totalChunks;
                break;
            case FrameType::FILE_ERROR:
                object["file_id"] = frame.fileId;
                object["error"] = frame.error;
                break;
            case FrameType::PEER_DISCOVERY:
                object["peer_id"] = frame.peerId;
                object["port"] = frame.port;
                break;
        }

        // Invalid UTF-8 in user text is replaced instead of throwing
        const std::string text = object.dump(-1, ' ', false, json::error_handler_t::replace);
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    // ------------------------------------------------------------
    // PARSING
    // ------------------------------------------------------------
    Frame parseFramePayload(const uint8_t* data, size_t size) {
        json object = json::parse(data, data + size, nullptr, false);
        if (object.is_discarded()) {
            throw MalformedFrame("Payload is not valid JSON");
        }
        if (!object.is_object()) {
            throw MalformedFrame("Payload is not a JSON object");
        }

        const std::string typeName = requireString(object, "type");
        auto type = frameTypeFromString(typeName);
        if (!type) {
            throw MalformedFrame("Unknown frame type '" + typeName + "'");
        }

        Frame frame;
        frame.type = *type;
        frame.from = requireString(object, "from");

        switch (frame.type) {
            case FrameType::TEXT_MESSAGE:
                frame.message = requireString(object, "message");
                break;
            case FrameType::FILE_REQUEST:
                frame.fileId = requireString(object, "file_id");
                frame.filename = requireString(object, "filename");
                frame.filesize = requireUnsigned(object, "filesize");
                break;
            case FrameType::FILE_ACCEPT: {
                frame.fileId = requireString(object, "file_id");
                auto it = object.find("save_path");
                if (it != object.end() && it->is_string()) frame.savePath = it->get<std::string>();
                break;
            }
            case FrameType::FILE_REJECT:
                frame.fileId = requireString(object, "file_id");
                break;
            case FrameType::FILE_CHUNK:
                frame.fileId = requireString(object, "file_id");
                frame.chunkNum = requireUnsigned(object, "chunk_num");
                break;
            case FrameType::FILE_COMPLETE:
                frame.fileId = requireString(object, "file_id");
                frame.totalChunks = requireUnsigned(object, "total_chunks");
                break;
            case FrameType::FILE_ERROR:
                frame.fileId = requireString(object, "file_id");
                frame.error = requireString(object, "error");
                break;
            case FrameType::PEER_DISCOVERY: {
                frame.peerId = requireString(object, "peer_id");
                uint64_t port = requireUnsigned(object, "port");
                if (port == 0 || port > 65535) {
                    throw MalformedFrame("Port out of range: " + std::to_string(port));
                }
                frame.port = static_cast<uint16_t>(port);
                break;
            }
        }

        return frame;
    }

    Frame parseFramePayload(const std::vector<uint8_t>& payload) {
        return parseFramePayload(payload.data(), payload.size());
    }

    std::vector<uint8_t> encodeFrame(const Frame& frame) {
        const std::vector<uint8_t> payload = serializeFramePayload(frame);

        std::vector<uint8_t> buffer(LENGTH_PREFIX_SIZE);
        buffer.reserve(LENGTH_PREFIX_SIZE + payload.size());
        writeLengthPrefix(static_cast<uint32_t>(payload.size()), buffer.data());
        buffer.insert(buffer.end(), payload.begin(), payload.end());
        return buffer;
    }

    std::vector<uint8_t> encodeChunkFrame(const Frame& descriptor, const uint8_t* data, size_t size) {
        std::vector<uint8_t> buffer = encodeFrame(descriptor);
        const size_t segmentStart = buffer.size();

        buffer.resize(segmentStart + LENGTH_PREFIX_SIZE);
        writeLengthPrefix(static_cast<uint32_t>(size), buffer.data() + segmentStart);
        if (size > 0) buffer.insert(buffer.end(), data, data + size);
        return buffer;
    }

    Frame decodeFrame(const std::vector<uint8_t>& bytes, size_t maxPayload, size_t* consumed) {
        if (bytes.size() < LENGTH_PREFIX_SIZE) {
            throw MalformedFrame("Truncated length prefix");
        }

        const uint32_t length = readLengthPrefix(bytes.data());
        if (length > maxPayload) {
            throw MalformedFrame("Declared length " + std::to_string(length) +
                                 " exceeds limit " + std::to_string(maxPayload));
        }
        if (bytes.size() - LENGTH_PREFIX_SIZE < length) {
            throw MalformedFrame("Payload shorter than declared length");
        }

        Frame frame = parseFramePayload(bytes.data() + LENGTH_PREFIX_SIZE, length);
        if (consumed) *consumed = LENGTH_PREFIX_SIZE + length;
        return frame;
    }

    // ------------------------------------------------------------
    // UTILITIES
    // ------------------------------------------------------------
    std::string frameTypeToString(FrameType type) {
        switch (type) {
            case FrameType::TEXT_MESSAGE:   return "TEXT_MESSAGE";
            case FrameType::FILE_REQUEST:   return "FILE_REQUEST";
            case FrameType::FILE_ACCEPT:    return "FILE_ACCEPT";
            case FrameType::FILE_REJECT:    return "FILE_REJECT";
            case FrameType::FILE_CHUNK:     return "FILE_CHUNK";
            case FrameType::FILE_COMPLETE:  return "FILE_COMPLETE";
            case FrameType::FILE_ERROR:     return "FILE_ERROR";
            case FrameType::PEER_DISCOVERY: return "PEER_DISCOVERY";
            default:                        return "UNKNOWN";
        }
    }

    std::optional<FrameType> frameTypeFromString(const std::string& name) {
        static const FrameType all[] = {
            FrameType::TEXT_MESSAGE, FrameType::FILE_REQUEST, FrameType::FILE_ACCEPT,
            FrameType::FILE_REJECT, FrameType::FILE_CHUNK, FrameType::FILE_COMPLETE,
            FrameType::FILE_ERROR, FrameType::PEER_DISCOVERY
        };
        for (FrameType type : all) {
            if (frameTypeToString(type) == name) return type;
        }
        return std::nullopt;
    }

    bool isTerminalFrame(FrameType type) {
        return type != FrameType::FILE_CHUNK;
    }

} // namespace lantext
