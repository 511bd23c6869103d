#ifndef LANTEXT_PEER_CONNECTION_HPP
#define LANTEXT_PEER_CONNECTION_HPP

#include "Frame.hpp"
#include "Types.hpp"
#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace lantext {

using tcp = boost::asio::ip::tcp;

/**
 * One accepted inbound connection. Reads length-prefixed frames and hands each decoded
 * frame to the frame handler. Control frames end the connection after dispatch; FILE_CHUNK
 * frames keep it open for the next chunk or the closing FILE_COMPLETE. If a chunk stream
 * ends any other way (EOF, timeout, bad frame, frame cap) the handler receives a
 * FILE_ERROR for the interrupted file.
 *
 * All handlers run on the socket's strand, so one connection never executes concurrently
 * with itself while different connections proceed in parallel.
 */
class PeerConnection : public std::enable_shared_from_this<PeerConnection> {
public:
    using Ptr = std::shared_ptr<PeerConnection>;
    using FrameCallback = std::function<void(const Frame&, const std::vector<uint8_t>& chunkData)>;
    using CloseCallback = std::function<void(const Ptr&)>;

    struct Limits {
        std::chrono::milliseconds controlTimeout = CONTROL_TIMEOUT;
        std::chrono::milliseconds streamTimeout = FILE_TIMEOUT;
        size_t maxFrames = MAX_FRAMES_PER_CONNECTION;
    };

    /**
     * Takes ownership of an accepted socket.
     *
     * @param socket The `socket` parameter must be bound to a strand executor; the
     * connection's deadline timer shares it.
     * @param limits Read deadlines and the per-connection frame cap.
     */
    PeerConnection(tcp::socket socket, const Limits& limits);

    /**
     * The PeerConnection destructor closes the socket connection with error handling.
     */
    ~PeerConnection();

    /**
     * Starts the read loop by reading the first length prefix.
     */
    void start();

    /**
     * Closes the connection from any thread. The close is performed on the connection's
     * strand; pending reads complete with operation_aborted.
     */
    void close();

    void setFrameHandler(FrameCallback cb);

    /**
     * The close handler runs exactly once, when the connection ends for any reason.
     */
    void setCloseHandler(CloseCallback cb);

    /**
     * Address of the remote end as text, captured on construction.
     */
    const std::string& remoteAddress() const;

    bool isConnected() const;

    /**
     * Number of frames received so far on this connection.
     */
    size_t frameCount() const;

private:
    /**
     * Reads the 4-byte length prefix of the next frame and validates it against the
     * control frame limit before any payload byte is read.
     */
    void asyncReadHeader();

    /**
     * Reads and parses the JSON payload announced by the prefix.
     *
     * @param payloadLen Declared payload length, already validated.
     */
    void asyncReadPayload(uint32_t payloadLen);

    /**
     * Reads the raw bytes segment that follows a FILE_CHUNK descriptor.
     */
    void asyncReadChunkHeader();
    void asyncReadChunkData(uint32_t chunkLen);

    void handleFrame(const Frame& frame, const std::vector<uint8_t>& chunkData);

    /**
     * Hands a frame to the frame handler, logging anything it throws.
     */
    void deliver(const Frame& frame, const std::vector<uint8_t>& chunkData);

    /**
     * Restarts the read deadline. When it fires the connection is dropped.
     */
    void armDeadline();

    /**
     * Closes the socket, cancels the deadline and notifies the close handler once. A chunk
     * stream cut short is first reported to the frame handler as a FILE_ERROR for its file.
     *
     * @param reason Logged when not empty.
     */
    void handleDisconnect(const std::string& reason = "");

    tcp::socket sock;
    boost::asio::steady_timer deadline;
    Limits limits;
    std::string remote;

    FrameCallback onFrame;
    CloseCallback onClose;

    std::array<uint8_t, LENGTH_PREFIX_SIZE> headerBuf{};
    std::vector<uint8_t> payloadBuf;
    std::vector<uint8_t> chunkBuf;
    Frame pendingChunk;

    std::atomic<size_t> frames{0};
    bool streaming = false;    // a FILE_CHUNK has been seen on this connection
    bool terminated = false;   // a terminal frame has been dispatched
    std::atomic<bool> connected{false};
};

} // namespace lantext

#endif // LANTEXT_PEER_CONNECTION_HPP
