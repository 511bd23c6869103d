#include "TransferRegistry.hpp"
#include <iostream>

namespace lantext {

    TransferRegistry::~TransferRegistry() {
        clear();
    }

    bool TransferRegistry::addPending(const TransferRequest& request) {
        std::lock_guard<std::mutex> lock(mtx);
        if (pending.count(request.fileId) || active.count(request.fileId)) return false;
        pending.emplace(request.fileId, request);
        return true;
    }

    std::optional<TransferRequest> TransferRegistry::takePending(const std::string& fileId, bool accepted) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = pending.find(fileId);
        if (it == pending.end()) return std::nullopt;
        TransferRequest request = std::move(it->second);
        pending.erase(it);
        request.status = accepted ? RequestStatus::ACCEPTED : RequestStatus::REJECTED;
        return request;
    }

    bool TransferRegistry::removePending(const std::string& fileId) {
        std::lock_guard<std::mutex> lock(mtx);
        return pending.erase(fileId) > 0;
    }

    bool TransferRegistry::addActive(const ActiveTransfer& transfer) {
        std::lock_guard<std::mutex> lock(mtx);
        if (pending.count(transfer.fileId) || active.count(transfer.fileId)) return false;
        active.emplace(transfer.fileId, transfer);
        return true;
    }

    std::optional<ActiveTransfer> TransferRegistry::getActive(const std::string& fileId) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = active.find(fileId);
        if (it == active.end()) return std::nullopt;
        return it->second;
    }

    bool TransferRegistry::markAccepted(const std::string& fileId, std::shared_ptr<std::ofstream> destination,
                                        const std::string& savePath) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = active.find(fileId);
        if (it == active.end() || it->second.status != TransferStatus::REQUESTED) return false;
        it->second.status = TransferStatus::ACCEPTED;
        it->second.destination = std::move(destination);
        it->second.savePath = savePath;
        return true;
    }

    ChunkResult TransferRegistry::appendChunk(const std::string& fileId, uint64_t chunkNum,
                                              const std::vector<uint8_t>& data, ChunkProgress* progress) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = active.find(fileId);
        if (it == active.end()) return ChunkResult::UNKNOWN_TRANSFER;

        ActiveTransfer& entry = it->second;
        if (entry.status != TransferStatus::ACCEPTED || !entry.destination || !entry.destination->is_open()) {
            return ChunkResult::UNKNOWN_TRANSFER;
        }

        // Local disk write; no socket I/O happens under this lock
        entry.destination->write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        entry.destination->flush();
        if (!*entry.destination) return ChunkResult::WRITE_FAILED;

        entry.receivedChunks.push_back(chunkNum);
        entry.bytesReceived += data.size();
        if (progress) {
            progress->bytesReceived = entry.bytesReceived;
            progress->filesize = entry.filesize;
        }
        return ChunkResult::WRITTEN;
    }

    std::optional<ActiveTransfer> TransferRegistry::markComplete(const std::string& fileId) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = active.find(fileId);
        if (it == active.end() || it->second.status != TransferStatus::ACCEPTED) return std::nullopt;
        it->second.status = TransferStatus::COMPLETE;
        return it->second;
    }

    std::optional<ActiveTransfer> TransferRegistry::removeActive(const std::string& fileId) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = active.find(fileId);
        if (it == active.end()) return std::nullopt;
        ActiveTransfer transfer = std::move(it->second);
        closeDestination(transfer);
        active.erase(it);
        return transfer;
    }

    bool TransferRegistry::hasTransfer(const std::string& fileId) const {
        std::lock_guard<std::mutex> lock(mtx);
        return pending.count(fileId) > 0 || active.count(fileId) > 0;
    }

    size_t TransferRegistry::pendingCount() const {
        std::lock_guard<std::mutex> lock(mtx);
        return pending.size();
    }

    size_t TransferRegistry::activeCount() const {
        std::lock_guard<std::mutex> lock(mtx);
        return active.size();
    }

    void TransferRegistry::clear() {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto& kv : active) {
            closeDestination(kv.second);
        }
        active.clear();
        pending.clear();
    }

    void TransferRegistry::closeDestination(ActiveTransfer& transfer) {
        if (!transfer.destination || !transfer.destination->is_open()) return;

        transfer.destination->close();
        if (transfer.destination->fail()) {
            // close failures are reported, never fatal
            std::cerr << "TransferRegistry: error closing " << transfer.savePath << " for "
                      << transfer.fileId << std::endl;
        }
    }

} // namespace lantext
