#pragma once

#include "taildrive/core/result.hpp"
#include "taildrive/model/types.hpp"

#include <filesystem>
#include <vector>

namespace taildrive::client {

/**
 * @brief Mobile-side persistence under the storage directory
 *
 * peers.json holds the last successfully fetched peer list. Loading it
 * always yields offline peers: the stored flags describe a past poll.
 * sync_projects.json mirrors the last fetched project table so the UI has
 * something to show before the first poll completes.
 *
 * An empty storage directory disables persistence; loads return empty lists
 * and saves succeed without writing.
 */
class LocalStore {
public:
    explicit LocalStore(std::filesystem::path storage_dir);

    /**
     * @brief Cached peers with online forced to false; missing file → empty
     */
    Result<std::vector<model::PeerInfo>> load_peers() const;

    Result<void> save_peers(const std::vector<model::PeerInfo>& peers) const;

    Result<std::vector<model::SyncProject>> load_projects() const;

    Result<void> save_projects(const std::vector<model::SyncProject>& projects) const;

    const std::filesystem::path& storage_dir() const { return storage_dir_; }

private:
    std::filesystem::path storage_dir_;
};

} // namespace taildrive::client
