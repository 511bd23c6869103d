#include "Config.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace lantext {

    namespace {

        // Negative and fractional values are rejected, as are values that do not fit `limit`
        uint64_t checkedUnsigned(const json& value, const char* key, uint64_t limit) {
            if (!value.is_number_unsigned()) {
                throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
            }
            uint64_t number = value.get<uint64_t>();
            if (number > limit) {
                throw std::out_of_range(std::string(key) + " must not exceed " + std::to_string(limit));
            }
            return number;
        }

        template <typename T>
        void readUnsigned(const json& object, const char* key, T& out) {
            auto it = object.find(key);
            if (it == object.end()) return;
            out = static_cast<T>(checkedUnsigned(*it, key, std::numeric_limits<T>::max()));
        }

        void readMillis(const json& object, const char* key, std::chrono::milliseconds& out) {
            auto it = object.find(key);
            if (it == object.end()) return;
            auto limit = static_cast<uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max());
            out = std::chrono::milliseconds(checkedUnsigned(*it, key, limit));
        }

    } // namespace

    bool loadNodeConfig(const std::string& path, NodeConfig& config) {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "Cannot open config file: " << path << std::endl;
            return false;
        }

        json object = json::parse(file, nullptr, false);
        if (object.is_discarded() || !object.is_object()) {
            std::cerr << "Config file is not a JSON object: " << path << std::endl;
            return false;
        }

        // Work on a copy so a bad value leaves the caller's config untouched
        NodeConfig loaded = config;
        try {
            auto peerIt = object.find("peer_id");
            if (peerIt != object.end()) loaded.peerId = peerIt->get<std::string>();

            readUnsigned(object, "port", loaded.messagingPort);
            readUnsigned(object, "discovery_port", loaded.discoveryPort);

            auto targetsIt = object.find("announce_targets");
            if (targetsIt != object.end()) {
                loaded.announceTargets.clear();
                for (const auto& entry : *targetsIt) {
                    AnnounceTarget target;
                    target.host = entry.at("host").get<std::string>();
                    readUnsigned(entry, "port", target.port);
                    loaded.announceTargets.push_back(target);
                }
            }

            readMillis(object, "broadcast_interval_ms", loaded.broadcastInterval);
            readMillis(object, "stale_threshold_ms", loaded.staleThreshold);
            readMillis(object, "control_timeout_ms", loaded.controlTimeout);
            readMillis(object, "file_timeout_ms", loaded.fileTimeout);
            readUnsigned(object, "chunk_size", loaded.chunkSize);
            readUnsigned(object, "max_frames_per_connection", loaded.maxFramesPerConnection);
            readUnsigned(object, "io_threads", loaded.ioThreads);
        } catch (const json::exception& e) {
            std::cerr << "Invalid config value in " << path << ": " << e.what() << std::endl;
            return false;
        } catch (const std::logic_error& e) {
            std::cerr << "Invalid config value in " << path << ": " << e.what() << std::endl;
            return false;
        }

        if (loaded.chunkSize == 0 || loaded.chunkSize > MAX_CHUNK_SEGMENT_SIZE) {
            std::cerr << "chunk_size must be between 1 and " << MAX_CHUNK_SEGMENT_SIZE << std::endl;
            return false;
        }
        if (loaded.ioThreads == 0) loaded.ioThreads = 1;

        config = loaded;
        return true;
    }

} // namespace lantext
