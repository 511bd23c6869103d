#include "PeerNode.hpp"
#include "IdGenerator.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace lantext {

    namespace {

        NodeConfig withIdentity(NodeConfig config) {
            if (config.peerId.empty()) {
                config.peerId = IdGenerator::generatePeerId();
            }
            return config;
        }

        NodeConfig makeConfig(const std::string& peerId, uint16_t port) {
            NodeConfig config;
            config.peerId = peerId;
            config.messagingPort = port;
            return config;
        }

        // Only regular files are removed; a device or fifo given as save path is left alone
        void discardPartialFile(const fs::path& target) {
            std::error_code ec;
            if (!fs::is_regular_file(target, ec)) return;
            fs::remove(target, ec);
            if (ec) {
                std::cerr << "PeerNode: cannot remove " << target.string() << ": " << ec.message() << std::endl;
            }
        }

    } // namespace

    PeerNode::PeerNode(const std::string& peerId, uint16_t port) : PeerNode(makeConfig(peerId, port)) {}

    PeerNode::PeerNode(const NodeConfig& cfg)
        : config(withIdentity(cfg)),
          selfId(config.peerId),
          messaging(selfId, config),
          discovery(selfId, 0, config) {
        wireMessaging();
        discovery.setPeerDiscoveredHandler([this](const std::string& id, const std::string& address, uint16_t port) {
            if (onPeerDiscovered) onPeerDiscovered(id, address, port);
        });
    }

    PeerNode::~PeerNode() {
        stop();
    }

    void PeerNode::start() {
        if (running.load()) return;

        // Messaging first: discovery announces the port it bound
        boundPort.store(messaging.start(config.messagingPort));
        discovery.setListeningPort(boundPort.load());
        try {
            discovery.start();
        } catch (const boost::system::system_error&) {
            messaging.stop();
            boundPort.store(0);
            throw;
        }

        running.store(true);
        std::cout << "PeerNode " << selfId << " started on port " << boundPort.load() << std::endl;
    }

    void PeerNode::stop() {
        if (!running.exchange(false)) return;

        discovery.stop();
        messaging.stop();
        reapSenders(true);
        registry.clear();

        std::cout << "PeerNode " << selfId << " stopped" << std::endl;
    }

    bool PeerNode::isRunning() const {
        return running.load();
    }

    bool PeerNode::sendMessage(const std::string& peerId, const std::string& text) {
        if (!running.load()) {
            std::cerr << "Error: Peer is not running" << std::endl;
            return false;
        }

        auto peer = resolvePeer(peerId);
        if (!peer) return false;

        return messaging.sendMessage(peer->address, peer->port, text);
    }

    std::optional<std::string> PeerNode::sendFile(const std::string& peerId, const std::string& path) {
        if (!running.load()) {
            std::cerr << "Error: Peer is not running" << std::endl;
            return std::nullopt;
        }

        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            std::cerr << "Error: File not found: " << path << std::endl;
            return std::nullopt;
        }
        uint64_t size = fs::file_size(path, ec);
        if (ec) {
            std::cerr << "Error: Cannot read size of " << path << ": " << ec.message() << std::endl;
            return std::nullopt;
        }

        auto peer = resolvePeer(peerId);
        if (!peer) return std::nullopt;

        TransferRequest request;
        request.fileId = IdGenerator::generateFileId();
        request.peerId = peerId;
        request.address = peer->address;
        request.port = peer->port;
        request.filePath = path;
        request.filename = fs::path(path).filename().string();
        request.filesize = size;

        if (!registry.addPending(request)) {
            std::cerr << "Error: Duplicate transfer id " << request.fileId << std::endl;
            return std::nullopt;
        }

        if (!messaging.sendFileRequest(peer->address, peer->port, request.fileId, request.filename, size)) {
            registry.removePending(request.fileId);
            return std::nullopt;
        }

        return request.fileId;
    }

    bool PeerNode::acceptFile(const std::string& fileId, const std::string& savePath) {
        auto transfer = registry.getActive(fileId);
        if (!transfer || transfer->status != TransferStatus::REQUESTED) {
            std::cerr << "Error: No pending file request " << fileId << std::endl;
            return false;
        }

        // Prefer the freshest address from discovery; the request's origin is the fallback
        std::string address = transfer->address;
        uint16_t port = transfer->port;
        if (auto peer = resolvePeer(transfer->peerId)) {
            address = peer->address;
            port = peer->port;
        }
        if (address.empty() || port == 0) {
            std::cerr << "Error: Peer " << transfer->peerId << " not found" << std::endl;
            return false;
        }

        fs::path target(savePath);
        std::error_code ec;
        if (fs::is_directory(target, ec)) {
            target /= fs::path(transfer->filename).filename();
        }

        auto destination = std::make_shared<std::ofstream>(target, std::ios::binary | std::ios::trunc);
        if (!destination->is_open()) {
            std::cerr << "Error: Cannot open " << target.string() << " for writing" << std::endl;
            registry.removeActive(fileId);
            return false;
        }

        if (!registry.markAccepted(fileId, destination, target.string())) {
            destination->close();
            discardPartialFile(target);
            return false;
        }

        if (!messaging.sendFileResponse(address, port, fileId, true, target.string())) {
            registry.removeActive(fileId);
            discardPartialFile(target);
            return false;
        }

        return true;
    }

    bool PeerNode::rejectFile(const std::string& fileId) {
        auto transfer = registry.getActive(fileId);
        if (!transfer || transfer->status != TransferStatus::REQUESTED) {
            std::cerr << "Error: No pending file request " << fileId << std::endl;
            return false;
        }

        std::string address = transfer->address;
        uint16_t port = transfer->port;
        if (auto peer = resolvePeer(transfer->peerId)) {
            address = peer->address;
            port = peer->port;
        }
        if (address.empty() || port == 0) {
            std::cerr << "Error: Peer " << transfer->peerId << " not found" << std::endl;
            return false;
        }

        if (!messaging.sendFileResponse(address, port, fileId, false)) return false;

        registry.removeActive(fileId);
        return true;
    }

    PeerMap PeerNode::getKnownPeers() {
        if (!running.load()) return {};
        return discovery.getPeers();
    }

    uint16_t PeerNode::port() const {
        return boundPort.load();
    }

    uint16_t PeerNode::discoveryPort() const {
        return discovery.localPort();
    }

    bool PeerNode::hasTransfer(const std::string& fileId) const {
        return registry.hasTransfer(fileId);
    }

    size_t PeerNode::pendingTransferCount() const {
        return registry.pendingCount();
    }

    size_t PeerNode::activeTransferCount() const {
        return registry.activeCount();
    }

    void PeerNode::addAnnounceTarget(const std::string& host, uint16_t port) {
        discovery.addAnnounceTarget(host, port);
    }

    void PeerNode::announceNow() {
        discovery.announceNow();
    }

    void PeerNode::setPeerDiscoveredHandler(PeerDiscoveredCallback cb) { onPeerDiscovered = std::move(cb); }
    void PeerNode::setMessageHandler(MessageCallback cb) { onMessage = std::move(cb); }
    void PeerNode::setFileRequestHandler(FileRequestCallback cb) { onFileRequest = std::move(cb); }
    void PeerNode::setFileResponseHandler(FileResponseCallback cb) { onFileResponse = std::move(cb); }
    void PeerNode::setFileProgressHandler(FileProgressCallback cb) { onFileProgress = std::move(cb); }
    void PeerNode::setFileCompleteHandler(FileCompleteCallback cb) { onFileComplete = std::move(cb); }
    void PeerNode::setFileErrorHandler(FileErrorCallback cb) { onFileError = std::move(cb); }

    void PeerNode::wireMessaging() {
        messaging.setMessageHandler([this](const std::string& from, const std::string& text) {
            if (onMessage) onMessage(from, text);
        });
        messaging.setFileRequestHandler([this](const std::string& from, const std::string& fileId,
                                               const std::string& filename, uint64_t filesize,
                                               const std::string& address) {
            handleFileRequest(from, fileId, filename, filesize, address);
        });
        messaging.setFileResponseHandler([this](const std::string& from, const std::string& fileId,
                                                bool accepted, const std::string& savePath) {
            handleFileResponse(from, fileId, accepted, savePath);
        });
        messaging.setFileChunkHandler([this](const std::string& from, const std::string& fileId,
                                             uint64_t chunkNum, const std::vector<uint8_t>& data) {
            handleFileChunk(from, fileId, chunkNum, data);
        });
        messaging.setFileCompleteHandler([this](const std::string& from, const std::string& fileId,
                                                uint64_t totalChunks) {
            handleFileComplete(from, fileId, totalChunks);
        });
        messaging.setFileErrorHandler([this](const std::string& from, const std::string& fileId,
                                             const std::string& error) {
            handleFileError(from, fileId, error);
        });
    }

    std::optional<PeerRecord> PeerNode::resolvePeer(const std::string& peerId) {
        auto peers = discovery.getPeers();
        auto it = peers.find(peerId);
        if (it == peers.end()) {
            std::cerr << "Error: Peer " << peerId << " not found" << std::endl;
            return std::nullopt;
        }
        return it->second;
    }

    void PeerNode::handleFileRequest(const std::string& from, const std::string& fileId,
                                     const std::string& filename, uint64_t filesize, const std::string& address) {
        ActiveTransfer transfer;
        transfer.fileId = fileId;
        transfer.peerId = from;
        transfer.address = address;
        transfer.filename = filename;
        transfer.filesize = filesize;
        transfer.status = TransferStatus::REQUESTED;

        // The request frame carries no port; only discovery knows it
        auto peers = discovery.getPeers();
        auto it = peers.find(from);
        if (it != peers.end()) {
            transfer.address = it->second.address;
            transfer.port = it->second.port;
        }

        if (!registry.addActive(transfer)) {
            std::cerr << "PeerNode: ignoring duplicate file request " << fileId << " from " << from << std::endl;
            return;
        }

        if (onFileRequest) onFileRequest(from, fileId, filename, filesize);
    }

    void PeerNode::handleFileResponse(const std::string& from, const std::string& fileId,
                                      bool accepted, const std::string& savePath) {
        auto request = registry.takePending(fileId, accepted);
        if (!request) {
            std::cerr << "PeerNode: response for unknown transfer " << fileId << " from " << from << std::endl;
            return;
        }

        if (request->status == RequestStatus::REJECTED) {
            if (onFileResponse) onFileResponse(from, fileId, false, savePath);
            reportError(from, fileId, "File transfer rejected by " + from);
            return;
        }

        ActiveTransfer transfer;
        transfer.fileId = fileId;
        transfer.peerId = request->peerId;
        transfer.address = request->address;
        transfer.port = request->port;
        transfer.filename = request->filename;
        transfer.filesize = request->filesize;
        transfer.status = TransferStatus::ACCEPTED;
        transfer.sourcePath = request->filePath;
        transfer.savePath = savePath;
        registry.addActive(transfer);

        if (onFileResponse) onFileResponse(from, fileId, true, savePath);

        spawnSender(*request);
    }

    void PeerNode::handleFileChunk(const std::string& from, const std::string& fileId,
                                   uint64_t chunkNum, const std::vector<uint8_t>& data) {
        ChunkProgress progress;
        switch (registry.appendChunk(fileId, chunkNum, data, &progress)) {
            case ChunkResult::UNKNOWN_TRANSFER:
                // transfer already discarded; late chunks are dropped
                return;
            case ChunkResult::WRITE_FAILED: {
                auto removed = registry.removeActive(fileId);
                std::string path = removed ? removed->savePath : std::string();
                reportError(from, fileId, "Failed to write chunk " + std::to_string(chunkNum) + " to " + path);
                return;
            }
            case ChunkResult::WRITTEN:
                if (onFileProgress) onFileProgress(from, fileId, progress.bytesReceived, progress.filesize);
                return;
        }
    }

    void PeerNode::handleFileComplete(const std::string& from, const std::string& fileId, uint64_t totalChunks) {
        auto transfer = registry.markComplete(fileId);
        if (!transfer) return;

        registry.removeActive(fileId);

        std::cout << "PeerNode: received " << transfer->filename << " (" << totalChunks << " chunks, "
                  << transfer->bytesReceived << " bytes) from " << from << std::endl;

        if (onFileComplete) onFileComplete(from, fileId, transfer->filename);
    }

    void PeerNode::handleFileError(const std::string& from, const std::string& fileId, const std::string& error) {
        bool known = registry.removeActive(fileId).has_value();
        known = registry.removePending(fileId) || known;
        if (!known) return;

        reportError(from, fileId, error);
    }

    void PeerNode::spawnSender(const TransferRequest& request) {
        reapSenders(false);

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread worker([this, request, done] {
            std::string error;
            bool ok = messaging.sendFileChunks(request.address, request.port, request.fileId,
                                               request.filePath, &error);
            registry.removeActive(request.fileId);
            if (!ok) {
                try {
                    reportError(request.peerId, request.fileId, error);
                } catch (const std::exception& e) {
                    std::cerr << "PeerNode: error in file error handler: " << e.what() << std::endl;
                }
            }
            done->store(true);
        });

        std::lock_guard<std::mutex> lock(senderMtx);
        senders.push_back(SenderTask{std::move(worker), done});
    }

    void PeerNode::reapSenders(bool joinAll) {
        std::vector<SenderTask> finished;
        {
            std::lock_guard<std::mutex> lock(senderMtx);
            for (auto it = senders.begin(); it != senders.end();) {
                if (joinAll || it->done->load()) {
                    finished.push_back(std::move(*it));
                    it = senders.erase(it);
                } else {
                    ++it;
                }
            }
        }

        for (auto& task : finished) {
            if (task.thread.joinable()) task.thread.join();
        }
    }

    void PeerNode::reportError(const std::string& from, const std::string& fileId, const std::string& error) {
        std::cerr << "PeerNode: transfer " << fileId << " failed: " << error << std::endl;
        if (onFileError) onFileError(from, fileId, error);
    }

} // namespace lantext
