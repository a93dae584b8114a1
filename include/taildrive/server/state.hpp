#pragma once

#include "taildrive/model/types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace taildrive::server {

/**
 * @brief The single most-recent-send slot
 *
 * Every begin() replaces the slot and returns a generation. finish() only
 * lands while the slot still holds that generation, so a send that completes
 * after a newer one started leaves the newer value alone.
 */
class SentInfoSlot {
public:
    uint64_t begin(model::SentFileInfo info) {
        std::lock_guard<std::mutex> lock(mutex_);
        info_ = std::move(info);
        return ++generation_;
    }

    bool finish(uint64_t generation, model::SentFileInfo info) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return false;
        }
        info_ = std::move(info);
        return true;
    }

    std::optional<model::SentFileInfo> get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return info_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<model::SentFileInfo> info_;
    uint64_t generation_ = 0;
};

/**
 * @brief Received-file bookkeeping: the latest name and known on-disk paths
 */
class ReceivedIndex {
public:
    /**
     * @brief A transfer observed on the event bus; becomes the latest file
     */
    void record(const model::InboundFile& file);

    /**
     * @brief Set the latest file only when none is known yet
     *
     * Used by the periodic inbox check, which catches files received
     * before the process started.
     */
    void record_if_empty(const std::string& name);

    void forget(const std::string& name);

    std::optional<std::string> last_file() const;

    std::optional<std::string> path_for(const std::string& name) const;

private:
    mutable std::mutex mutex_;
    std::optional<std::string> last_file_;
    std::unordered_map<std::string, std::string> paths_;
};

/**
 * @brief Latest peer list from the backend
 */
class PeerCache {
public:
    void replace(std::vector<model::PeerInfo> peers) {
        std::lock_guard<std::mutex> lock(mutex_);
        peers_ = std::move(peers);
    }

    std::vector<model::PeerInfo> all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peers_;
    }

    std::vector<model::PeerInfo> without_self() const;

private:
    mutable std::mutex mutex_;
    std::vector<model::PeerInfo> peers_;
};

/**
 * @brief The per-table locks shared by the HTTP service and background tasks
 */
struct ServerState {
    SentInfoSlot sent;
    ReceivedIndex received;
    PeerCache peers;
};

} // namespace taildrive::server
