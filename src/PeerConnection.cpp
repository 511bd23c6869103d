#include "PeerConnection.hpp"
#include <iostream>

namespace lantext {

    PeerConnection::PeerConnection(tcp::socket socket, const Limits& limits)
        : sock(std::move(socket)), deadline(sock.get_executor()), limits(limits) {
        boost::system::error_code ec;
        auto endpoint = sock.remote_endpoint(ec);
        remote = ec ? std::string("unknown") : endpoint.address().to_string();
    }

    PeerConnection::~PeerConnection() {
        boost::system::error_code ec;
        sock.close(ec);
    }

    void PeerConnection::start() {
        connected.store(true);
        // start read loop on the connection's strand
        auto self = shared_from_this();
        boost::asio::dispatch(sock.get_executor(), [this, self] {
            asyncReadHeader();
        });
    }

    void PeerConnection::close() {
        auto self = shared_from_this();
        boost::asio::post(sock.get_executor(), [this, self] {
            handleDisconnect();
        });
    }

    void PeerConnection::setFrameHandler(FrameCallback cb) { onFrame = std::move(cb); }

    void PeerConnection::setCloseHandler(CloseCallback cb) { onClose = std::move(cb); }

    const std::string& PeerConnection::remoteAddress() const { return remote; }

    bool PeerConnection::isConnected() const { return connected.load(); }

    size_t PeerConnection::frameCount() const { return frames.load(); }

    void PeerConnection::armDeadline() {
        auto self = shared_from_this();
        deadline.expires_after(streaming ? limits.streamTimeout : limits.controlTimeout);
        deadline.async_wait([this, self](const boost::system::error_code& ec) {
            if (ec) return; // re-armed or cancelled
            handleDisconnect("read timed out");
        });
    }

    void PeerConnection::asyncReadHeader() {
        if (!connected.load()) return;
        armDeadline();

        auto self = shared_from_this();
        boost::asio::async_read(sock, boost::asio::buffer(headerBuf),
            [this, self](const boost::system::error_code& ec, size_t) {
                if (ec) {
                    // EOF between frames is the normal end of a connection
                    handleDisconnect();
                    return;
                }

                uint32_t payloadLen = readLengthPrefix(headerBuf.data());
                if (payloadLen > MAX_CONTROL_FRAME_SIZE) {
                    handleDisconnect("Message too large (" + std::to_string(payloadLen) + " bytes), ignoring");
                    return;
                }
                asyncReadPayload(payloadLen);
            });
    }

    void PeerConnection::asyncReadPayload(uint32_t payloadLen) {
        payloadBuf.resize(payloadLen);
        auto self = shared_from_this();
        boost::asio::async_read(sock, boost::asio::buffer(payloadBuf),
            [this, self](const boost::system::error_code& ec, size_t) {
                if (ec) {
                    handleDisconnect("connection ended inside a frame");
                    return;
                }

                Frame frame;
                try {
                    frame = parseFramePayload(payloadBuf);
                } catch (const MalformedFrame& e) {
                    handleDisconnect(std::string("Malformed frame: ") + e.what());
                    return;
                }

                frames.fetch_add(1);

                if (frame.type == FrameType::FILE_CHUNK) {
                    pendingChunk = std::move(frame);
                    streaming = true;
                    asyncReadChunkHeader();
                    return;
                }

                handleFrame(frame, {});
            });
    }

    void PeerConnection::asyncReadChunkHeader() {
        armDeadline();
        auto self = shared_from_this();
        boost::asio::async_read(sock, boost::asio::buffer(headerBuf),
            [this, self](const boost::system::error_code& ec, size_t) {
                if (ec) {
                    handleDisconnect("chunk data missing");
                    return;
                }

                uint32_t chunkLen = readLengthPrefix(headerBuf.data());
                if (chunkLen > MAX_CHUNK_SEGMENT_SIZE) {
                    handleDisconnect("Chunk too large (" + std::to_string(chunkLen) + " bytes)");
                    return;
                }
                asyncReadChunkData(chunkLen);
            });
    }

    void PeerConnection::asyncReadChunkData(uint32_t chunkLen) {
        chunkBuf.resize(chunkLen);
        auto self = shared_from_this();
        boost::asio::async_read(sock, boost::asio::buffer(chunkBuf),
            [this, self](const boost::system::error_code& ec, size_t) {
                if (ec) {
                    handleDisconnect("chunk data truncated");
                    return;
                }
                handleFrame(pendingChunk, chunkBuf);
            });
    }

    void PeerConnection::deliver(const Frame& frame, const std::vector<uint8_t>& chunkData) {
        if (!onFrame) return;
        try {
            onFrame(frame, chunkData);
        } catch (const std::exception& e) {
            std::cerr << "Error handling " << frameTypeToString(frame.type)
                      << " from " << remote << ": " << e.what() << std::endl;
        }
    }

    void PeerConnection::handleFrame(const Frame& frame, const std::vector<uint8_t>& chunkData) {
        deliver(frame, chunkData);

        if (isTerminalFrame(frame.type)) {
            terminated = true;
            handleDisconnect();
            return;
        }

        if (frames.load() >= limits.maxFrames) {
            handleDisconnect("frame limit of " + std::to_string(limits.maxFrames) + " reached");
            return;
        }

        asyncReadHeader();
    }

    void PeerConnection::handleDisconnect(const std::string& reason) {
        if (!connected.exchange(false)) return;

        if (!reason.empty()) {
            std::cerr << "PeerConnection " << remote << ": " << reason << std::endl;
        }

        boost::system::error_code ec;
        deadline.cancel();
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);

        // A chunk stream that ends without FILE_COMPLETE or FILE_ERROR is reported as an error
        if (streaming && !terminated) {
            terminated = true;
            std::string cause = reason.empty() ? "connection closed before the transfer completed" : reason;
            deliver(makeFileError(pendingChunk.from, pendingChunk.fileId, "Transfer interrupted: " + cause), {});
        }

        if (onClose) {
            auto self = shared_from_this();
            onClose(self);
        }
    }

} // namespace lantext
