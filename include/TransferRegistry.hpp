#ifndef LANTEXT_TRANSFER_REGISTRY_HPP
#define LANTEXT_TRANSFER_REGISTRY_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lantext {

    enum class RequestStatus { PENDING, ACCEPTED, REJECTED };

    enum class TransferStatus { REQUESTED, ACCEPTED, COMPLETE };

    // Outgoing file offer waiting for the receiver's answer
    struct TransferRequest {
        std::string fileId;
        std::string peerId;
        std::string address;
        uint16_t port = 0;
        std::string filePath;
        std::string filename;
        uint64_t filesize = 0;
        RequestStatus status = RequestStatus::PENDING;
    };

    /**
     * A transfer in progress, on either side. Incoming transfers are created in the REQUESTED
     * state and receive a destination once accepted; outgoing ones are created ACCEPTED with
     * `sourcePath` set while their chunks are being streamed.
     */
    struct ActiveTransfer {
        std::string fileId;
        std::string peerId;
        std::string address;
        uint16_t port = 0;
        std::string filename;
        uint64_t filesize = 0;
        TransferStatus status = TransferStatus::REQUESTED;

        std::string sourcePath;
        std::string savePath;
        std::shared_ptr<std::ofstream> destination;

        std::vector<uint64_t> receivedChunks;
        uint64_t bytesReceived = 0;
    };

    enum class ChunkResult { WRITTEN, UNKNOWN_TRANSFER, WRITE_FAILED };

    // Totals reported after a chunk is written
    struct ChunkProgress {
        uint64_t bytesReceived = 0;
        uint64_t filesize = 0;
    };

    /**
     * Pending outgoing requests and active transfers, keyed by file id. A file id lives in at
     * most one of the two maps. All operations lock one mutex for the duration of the map
     * operation only; callers receive copies.
     */
    class TransferRegistry {
        public:
            TransferRegistry() = default;
            ~TransferRegistry();

            TransferRegistry(const TransferRegistry&) = delete;
            TransferRegistry& operator=(const TransferRegistry&) = delete;

            /**
             * @return false if the file id is already pending or active.
             */
            bool addPending(const TransferRequest& request);

            /**
             * Removes a pending request once the receiver has answered it.
             *
             * @param accepted The receiver's answer, recorded in the returned request's status.
             * @return The answered request, or nullopt if the id was not pending.
             */
            std::optional<TransferRequest> takePending(const std::string& fileId, bool accepted);
            bool removePending(const std::string& fileId);

            /**
             * @return false if the file id is already pending or active.
             */
            bool addActive(const ActiveTransfer& transfer);

            /**
             * Copy of an active transfer. The destination stream is shared, not duplicated.
             */
            std::optional<ActiveTransfer> getActive(const std::string& fileId) const;

            /**
             * Moves a REQUESTED transfer to ACCEPTED and attaches its open destination.
             * @return false if the transfer is unknown or no longer REQUESTED.
             */
            bool markAccepted(const std::string& fileId, std::shared_ptr<std::ofstream> destination,
                              const std::string& savePath);

            /**
             * Appends a received chunk to the transfer's destination and flushes it, so a
             * failing disk is reported on the chunk that hit it.
             *
             * @param fileId Transfer the chunk belongs to.
             * @param chunkNum Sequence number reported by the sender; recorded, not validated.
             * @param data Raw chunk bytes.
             * @param progress If not null, receives the byte totals after a write.
             */
            ChunkResult appendChunk(const std::string& fileId, uint64_t chunkNum,
                                    const std::vector<uint8_t>& data, ChunkProgress* progress = nullptr);

            /**
             * Marks an ACCEPTED transfer complete and returns it.
             * @return nullopt if the transfer is unknown or was never accepted.
             */
            std::optional<ActiveTransfer> markComplete(const std::string& fileId);

            /**
             * Closes the destination (if any) and removes the entry.
             * @return The removed transfer, if it existed.
             */
            std::optional<ActiveTransfer> removeActive(const std::string& fileId);

            bool hasTransfer(const std::string& fileId) const;
            size_t pendingCount() const;
            size_t activeCount() const;

            /**
             * Drops every entry, closing all open destinations.
             */
            void clear();

        private:
            static void closeDestination(ActiveTransfer& transfer);

            mutable std::mutex mtx;
            std::unordered_map<std::string, TransferRequest> pending;
            std::unordered_map<std::string, ActiveTransfer> active;
    };

} // namespace lantext

#endif // LANTEXT_TRANSFER_REGISTRY_HPP
