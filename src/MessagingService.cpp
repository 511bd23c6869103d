#include "MessagingService.hpp"
#include "OutboundConnection.hpp"
#include <fstream>
#include <iostream>

namespace lantext {

    MessagingService::MessagingService(const std::string& peerId, const NodeConfig& config)
        : selfId(peerId), config(config), io(), acceptor(boost::asio::make_strand(io)) {}

    MessagingService::~MessagingService() {
        stop();
    }

    uint16_t MessagingService::start(uint16_t port) {
        if (running.exchange(true)) return boundPort.load();

        try {
            io.restart();
            tcp::endpoint endpoint(tcp::v4(), port);
            acceptor.open(endpoint.protocol());
            acceptor.set_option(boost::asio::socket_base::reuse_address(true));
            acceptor.bind(endpoint);
            acceptor.listen(boost::asio::socket_base::max_listen_connections);
            boundPort.store(acceptor.local_endpoint().port());
        } catch (const boost::system::system_error& e) {
            std::cerr << "MessagingService: cannot listen on port " << port << ": " << e.what() << std::endl;
            boost::system::error_code ec;
            acceptor.close(ec);
            running.store(false);
            throw;
        }

        workGuard.emplace(boost::asio::make_work_guard(io));
        doAccept();

        size_t threadCount = config.ioThreads > 0 ? config.ioThreads : 1;
        for (size_t i = 0; i < threadCount; ++i) {
            ioThreads.emplace_back([this] {
                try {
                    io.run();
                } catch (const std::exception& e) {
                    std::cerr << "MessagingService IO context error: " << e.what() << std::endl;
                }
            });
        }

        std::cout << "MessagingService: listening on port " << boundPort.load() << std::endl;
        return boundPort.load();
    }

    void MessagingService::stop() {
        if (!running.exchange(false)) return;

        boost::asio::post(acceptor.get_executor(), [this] {
            boost::system::error_code ec;
            acceptor.close(ec);
        });

        // Close connections
        std::set<PeerConnection::Ptr> open;
        {
            std::lock_guard<std::mutex> lock(connMtx);
            open = connections;
        }
        for (auto& conn : open) {
            conn->close();
        }

        workGuard.reset();
        for (auto& t : ioThreads) {
            if (t.joinable()) t.join();
        }
        ioThreads.clear();

        {
            std::lock_guard<std::mutex> lock(connMtx);
            connections.clear();
        }
        boundPort.store(0);
    }

    bool MessagingService::isRunning() const {
        return running.load();
    }

    uint16_t MessagingService::port() const {
        return boundPort.load();
    }

    size_t MessagingService::connectionCount() const {
        std::lock_guard<std::mutex> lock(connMtx);
        return connections.size();
    }

    void MessagingService::setMessageHandler(MessageCallback cb) { onMessage = std::move(cb); }
    void MessagingService::setFileRequestHandler(FileRequestCallback cb) { onFileRequest = std::move(cb); }
    void MessagingService::setFileResponseHandler(FileResponseCallback cb) { onFileResponse = std::move(cb); }
    void MessagingService::setFileChunkHandler(FileChunkCallback cb) { onFileChunk = std::move(cb); }
    void MessagingService::setFileCompleteHandler(FileCompleteCallback cb) { onFileComplete = std::move(cb); }
    void MessagingService::setFileErrorHandler(FileErrorCallback cb) { onFileError = std::move(cb); }

    void MessagingService::doAccept() {
        // Each accepted socket gets its own strand
        acceptor.async_accept(boost::asio::make_strand(io),
            [this](const boost::system::error_code& ec, tcp::socket socket) {
                if (!running.load()) {
                    boost::system::error_code ignored;
                    socket.close(ignored);
                    return;
                }

                if (ec) {
                    if (ec == boost::asio::error::operation_aborted) return;
                    std::cerr << "MessagingService: accept error: " << ec.message() << std::endl;
                } else {
                    onNewConnection(std::move(socket));
                }

                doAccept();
            });
    }

    void MessagingService::onNewConnection(tcp::socket socket) {
        PeerConnection::Limits limits;
        limits.controlTimeout = config.controlTimeout;
        limits.streamTimeout = config.fileTimeout;
        limits.maxFrames = config.maxFramesPerConnection;

        auto conn = std::make_shared<PeerConnection>(std::move(socket), limits);
        std::string address = conn->remoteAddress();

        conn->setFrameHandler([this, address](const Frame& frame, const std::vector<uint8_t>& data) {
            dispatch(frame, data, address);
        });
        conn->setCloseHandler([this](const PeerConnection::Ptr& closed) {
            removeConnection(closed);
        });

        {
            std::lock_guard<std::mutex> lock(connMtx);
            connections.insert(conn);
        }
        conn->start();
    }

    void MessagingService::removeConnection(const PeerConnection::Ptr& conn) {
        std::lock_guard<std::mutex> lock(connMtx);
        connections.erase(conn);
    }

    void MessagingService::dispatch(const Frame& frame, const std::vector<uint8_t>& chunkData,
                                    const std::string& address) {
        switch (frame.type) {
            case FrameType::TEXT_MESSAGE:
                if (onMessage) onMessage(frame.from, frame.message);
                break;
            case FrameType::FILE_REQUEST:
                if (onFileRequest) onFileRequest(frame.from, frame.fileId, frame.filename, frame.filesize, address);
                break;
            case FrameType::FILE_ACCEPT:
            case FrameType::FILE_REJECT:
                if (onFileResponse) {
                    onFileResponse(frame.from, frame.fileId, frame.type == FrameType::FILE_ACCEPT, frame.savePath);
                }
                break;
            case FrameType::FILE_CHUNK:
                if (onFileChunk) onFileChunk(frame.from, frame.fileId, frame.chunkNum, chunkData);
                break;
            case FrameType::FILE_COMPLETE:
                if (onFileComplete) onFileComplete(frame.from, frame.fileId, frame.totalChunks);
                break;
            case FrameType::FILE_ERROR:
                if (onFileError) onFileError(frame.from, frame.fileId, frame.error);
                break;
            case FrameType::PEER_DISCOVERY:
                std::cerr << "MessagingService: ignoring " << frameTypeToString(frame.type)
                          << " from " << address << std::endl;
                break;
        }
    }

    bool MessagingService::sendControlFrame(const std::string& host, uint16_t port, const Frame& frame) {
        auto bytes = encodeFrame(frame);
        if (bytes.size() - LENGTH_PREFIX_SIZE > MAX_CONTROL_FRAME_SIZE) {
            std::cerr << "MessagingService: " << frameTypeToString(frame.type) << " of "
                      << bytes.size() - LENGTH_PREFIX_SIZE << " bytes exceeds the "
                      << MAX_CONTROL_FRAME_SIZE << " byte limit, not sent" << std::endl;
            return false;
        }

        OutboundConnection conn(config.controlTimeout);
        if (!conn.connect(host, port) || !conn.write(bytes)) {
            std::cerr << "MessagingService: " << conn.lastError() << std::endl;
            return false;
        }
        conn.close();
        return true;
    }

    bool MessagingService::sendMessage(const std::string& host, uint16_t port, const std::string& text) {
        return sendControlFrame(host, port, makeTextMessage(selfId, text));
    }

    bool MessagingService::sendFileRequest(const std::string& host, uint16_t port, const std::string& fileId,
                                           const std::string& filename, uint64_t filesize) {
        return sendControlFrame(host, port, makeFileRequest(selfId, fileId, filename, filesize));
    }

    bool MessagingService::sendFileResponse(const std::string& host, uint16_t port, const std::string& fileId,
                                            bool accepted, const std::string& savePath) {
        return sendControlFrame(host, port, makeFileResponse(selfId, fileId, accepted, savePath));
    }

    bool MessagingService::sendFileError(const std::string& host, uint16_t port, const std::string& fileId,
                                         const std::string& error) {
        return sendControlFrame(host, port, makeFileError(selfId, fileId, error));
    }

    bool MessagingService::sendFileChunks(const std::string& host, uint16_t port, const std::string& fileId,
                                          const std::string& path, std::string* error) {
        auto fail = [&](const std::string& reason) {
            std::cerr << "MessagingService: file " << fileId << ": " << reason << std::endl;
            if (error) *error = reason;
            // best effort, the receiver may already be gone
            sendFileError(host, port, fileId, reason);
            return false;
        };

        std::ifstream in(path, std::ios::binary);
        if (!in) return fail("Cannot open " + path);

        OutboundConnection conn(config.fileTimeout);
        if (!conn.connect(host, port)) return fail(conn.lastError());

        size_t chunkSize = config.chunkSize > 0 ? config.chunkSize : CHUNK_SIZE;
        std::vector<uint8_t> buf(chunkSize);
        uint64_t chunkNum = 0;

        while (in) {
            if (!running.load()) {
                conn.close();
                return fail("Transfer cancelled");
            }

            in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
            std::streamsize got = in.gcount();
            if (got <= 0) break;

            auto frame = encodeChunkFrame(makeFileChunk(selfId, fileId, chunkNum), buf.data(), static_cast<size_t>(got));
            if (!conn.write(frame)) {
                std::string reason = conn.lastError();
                conn.close();
                return fail(reason);
            }
            ++chunkNum;
        }

        if (in.bad()) {
            conn.close();
            return fail("Read error on " + path);
        }

        if (!conn.write(encodeFrame(makeFileComplete(selfId, fileId, chunkNum)))) {
            std::string reason = conn.lastError();
            conn.close();
            return fail(reason);
        }

        conn.close();
        std::cout << "MessagingService: sent " << chunkNum << " chunks of " << fileId << " to "
                  << host << ":" << port << std::endl;
        return true;
    }

} // namespace lantext
