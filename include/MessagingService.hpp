#ifndef LANTEXT_MESSAGING_SERVICE_HPP
#define LANTEXT_MESSAGING_SERVICE_HPP

#include "Config.hpp"
#include "Frame.hpp"
#include "PeerConnection.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace lantext {

    using tcp = boost::asio::ip::tcp;

    /**
     * TCP side of a peer. Accepts inbound connections on a pool of I/O threads and dispatches
     * the frames they carry to the registered handlers; sends frames to other peers over a
     * fresh connection per control frame and one connection per file stream.
     */
    class MessagingService {
        public:
            using MessageCallback = std::function<void(const std::string& from, const std::string& text)>;
            using FileRequestCallback = std::function<void(const std::string& from, const std::string& fileId,
                                                           const std::string& filename, uint64_t filesize,
                                                           const std::string& address)>;
            using FileResponseCallback = std::function<void(const std::string& from, const std::string& fileId,
                                                            bool accepted, const std::string& savePath)>;
            using FileChunkCallback = std::function<void(const std::string& from, const std::string& fileId,
                                                         uint64_t chunkNum, const std::vector<uint8_t>& data)>;
            using FileCompleteCallback = std::function<void(const std::string& from, const std::string& fileId,
                                                            uint64_t totalChunks)>;
            using FileErrorCallback = std::function<void(const std::string& from, const std::string& fileId,
                                                         const std::string& error)>;

            MessagingService(const std::string& peerId, const NodeConfig& config = NodeConfig());
            ~MessagingService();

            MessagingService(const MessagingService&) = delete;
            MessagingService& operator=(const MessagingService&) = delete;

            /**
             * Binds the listener and starts accepting.
             *
             * @param port TCP port to bind; 0 lets the OS pick one.
             * @return The bound port. When already running, the current port.
             * @throws boost::system::system_error if the port cannot be bound.
             */
            uint16_t start(uint16_t port);

            /**
             * Closes the listener and every open inbound connection, then joins the I/O
             * threads. Chunk streams in progress stop before their next chunk.
             */
            void stop();

            bool isRunning() const;
            uint16_t port() const;
            size_t connectionCount() const;

            void setMessageHandler(MessageCallback cb);
            void setFileRequestHandler(FileRequestCallback cb);
            void setFileResponseHandler(FileResponseCallback cb);
            void setFileChunkHandler(FileChunkCallback cb);
            void setFileCompleteHandler(FileCompleteCallback cb);
            void setFileErrorHandler(FileErrorCallback cb);

            // Outbound. Each call blocks until the frame is written or the timeout expires.
            bool sendMessage(const std::string& host, uint16_t port, const std::string& text);
            bool sendFileRequest(const std::string& host, uint16_t port, const std::string& fileId,
                                 const std::string& filename, uint64_t filesize);
            bool sendFileResponse(const std::string& host, uint16_t port, const std::string& fileId,
                                  bool accepted, const std::string& savePath = "");
            bool sendFileError(const std::string& host, uint16_t port, const std::string& fileId,
                               const std::string& error);

            /**
             * Streams a file as FILE_CHUNK frames over one connection and ends the stream
             * with FILE_COMPLETE. On failure a FILE_ERROR is attempted on a new connection.
             *
             * @param path Local file to send.
             * @param error If not null, receives the failure description.
             * @return true once FILE_COMPLETE has been written.
             */
            bool sendFileChunks(const std::string& host, uint16_t port, const std::string& fileId,
                                const std::string& path, std::string* error = nullptr);

        private:
            void doAccept();
            void onNewConnection(tcp::socket socket);
            void removeConnection(const PeerConnection::Ptr& conn);
            void dispatch(const Frame& frame, const std::vector<uint8_t>& chunkData, const std::string& address);

            /**
             * Opens a connection, writes one encoded frame and closes.
             */
            bool sendControlFrame(const std::string& host, uint16_t port, const Frame& frame);

            std::string selfId;
            NodeConfig config;

            boost::asio::io_context io;
            std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard;
            tcp::acceptor acceptor;
            std::vector<std::thread> ioThreads;

            std::set<PeerConnection::Ptr> connections;
            mutable std::mutex connMtx;

            MessageCallback onMessage;
            FileRequestCallback onFileRequest;
            FileResponseCallback onFileResponse;
            FileChunkCallback onFileChunk;
            FileCompleteCallback onFileComplete;
            FileErrorCallback onFileError;

            std::atomic<bool> running{false};
            std::atomic<uint16_t> boundPort{0};
    };

} // namespace lantext

#endif // LANTEXT_MESSAGING_SERVICE_HPP
