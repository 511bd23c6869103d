#ifndef LANTEXT_PEER_NODE_HPP
#define LANTEXT_PEER_NODE_HPP

#include "Config.hpp"
#include "MessagingService.hpp"
#include "PeerDiscovery.hpp"
#include "TransferRegistry.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lantext {

    /**
     * One addressable peer: discovery and messaging composed behind a single object, plus the
     * file transfer state machines. Peer ids are resolved through discovery right before
     * every send.
     *
     * Callbacks run on the service threads that observed the event (discovery thread,
     * messaging I/O threads or a chunk sender thread). Register them before start().
     */
    class PeerNode {
        public:
            using PeerDiscoveredCallback = PeerDiscovery::PeerDiscoveredCallback;
            using MessageCallback = std::function<void(const std::string& from, const std::string& text)>;
            using FileRequestCallback = std::function<void(const std::string& from, const std::string& fileId,
                                                           const std::string& filename, uint64_t filesize)>;
            using FileResponseCallback = std::function<void(const std::string& from, const std::string& fileId,
                                                            bool accepted, const std::string& savePath)>;
            using FileProgressCallback = std::function<void(const std::string& from, const std::string& fileId,
                                                            uint64_t bytesReceived, uint64_t totalBytes)>;
            using FileCompleteCallback = std::function<void(const std::string& from, const std::string& fileId,
                                                            const std::string& filename)>;
            using FileErrorCallback = std::function<void(const std::string& from, const std::string& fileId,
                                                         const std::string& error)>;

            /**
             * @param peerId Identifier announced to other peers; a random 8 hex character id
             * is generated when empty.
             * @param port TCP messaging port; 0 lets the OS choose.
             */
            explicit PeerNode(const std::string& peerId = "", uint16_t port = 0);
            explicit PeerNode(const NodeConfig& config);
            ~PeerNode();

            PeerNode(const PeerNode&) = delete;
            PeerNode& operator=(const PeerNode&) = delete;

            /**
             * Starts messaging (to learn the bound port) and then discovery.
             * @throws boost::system::system_error if either socket cannot be bound.
             */
            void start();

            /**
             * Stops discovery, then messaging, then waits for chunk senders and drops every
             * transfer. Safe to call more than once.
             */
            void stop();

            bool isRunning() const;

            // ============================================================
            //  ACTIONS
            // ============================================================

            /**
             * Sends a text message to a discovered peer.
             * @return false if not running, the peer is unknown or the send failed.
             */
            bool sendMessage(const std::string& peerId, const std::string& text);

            /**
             * Offers a local file to a peer.
             * @return The new file id, or nullopt if the file or peer is missing or the
             * request could not be sent.
             */
            std::optional<std::string> sendFile(const std::string& peerId, const std::string& path);

            /**
             * Accepts an incoming file. `savePath` may name a file or an existing directory, in
             * which case the offered filename is used inside it.
             */
            bool acceptFile(const std::string& fileId, const std::string& savePath);

            bool rejectFile(const std::string& fileId);

            // ============================================================
            //  QUERIES
            // ============================================================
            PeerMap getKnownPeers();
            const std::string& peerId() const { return selfId; }
            uint16_t port() const;
            uint16_t discoveryPort() const;
            bool hasTransfer(const std::string& fileId) const;
            size_t pendingTransferCount() const;
            size_t activeTransferCount() const;

            // Announcements also go to this host; kept across restarts
            void addAnnounceTarget(const std::string& host, uint16_t port);
            void announceNow();

            // ============================================================
            //  CALLBACKS
            // ============================================================
            void setPeerDiscoveredHandler(PeerDiscoveredCallback cb);
            void setMessageHandler(MessageCallback cb);
            void setFileRequestHandler(FileRequestCallback cb);
            void setFileResponseHandler(FileResponseCallback cb);
            void setFileProgressHandler(FileProgressCallback cb);
            void setFileCompleteHandler(FileCompleteCallback cb);
            void setFileErrorHandler(FileErrorCallback cb);

        private:
            struct SenderTask {
                std::thread thread;
                std::shared_ptr<std::atomic<bool>> done;
            };

            void wireMessaging();
            std::optional<PeerRecord> resolvePeer(const std::string& peerId);

            void handleFileRequest(const std::string& from, const std::string& fileId,
                                   const std::string& filename, uint64_t filesize, const std::string& address);
            void handleFileResponse(const std::string& from, const std::string& fileId,
                                    bool accepted, const std::string& savePath);
            void handleFileChunk(const std::string& from, const std::string& fileId,
                                 uint64_t chunkNum, const std::vector<uint8_t>& data);
            void handleFileComplete(const std::string& from, const std::string& fileId, uint64_t totalChunks);
            void handleFileError(const std::string& from, const std::string& fileId, const std::string& error);

            /**
             * Streams an accepted outgoing transfer on its own thread.
             */
            void spawnSender(const TransferRequest& request);
            void reapSenders(bool joinAll);

            void reportError(const std::string& from, const std::string& fileId, const std::string& error);

            NodeConfig config;
            std::string selfId;

            MessagingService messaging;
            PeerDiscovery discovery;
            TransferRegistry registry;

            std::vector<SenderTask> senders;
            std::mutex senderMtx;

            PeerDiscoveredCallback onPeerDiscovered;
            MessageCallback onMessage;
            FileRequestCallback onFileRequest;
            FileResponseCallback onFileResponse;
            FileProgressCallback onFileProgress;
            FileCompleteCallback onFileComplete;
            FileErrorCallback onFileError;

            std::atomic<bool> running{false};
            std::atomic<uint16_t> boundPort{0};
    };

} // namespace lantext

#endif // LANTEXT_PEER_NODE_HPP
