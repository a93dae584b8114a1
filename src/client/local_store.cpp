#include "taildrive/client/local_store.hpp"
#include "taildrive/core/file_util.hpp"
#include "taildrive/model/json.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace taildrive::client {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kPeersFile = "peers.json";
constexpr const char* kProjectsFile = "sync_projects.json";

template<typename T>
Result<std::vector<T>> load_array(const fs::path& file) {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return Ok(std::vector<T>{});
    }

    auto contents = read_file(file);
    if (contents.is_error()) {
        return Err(contents.error());
    }

    const auto& bytes = contents.value();
    json doc = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        return Err(file.string() + " is not a JSON array");
    }

    try {
        return Ok(doc.get<std::vector<T>>());
    } catch (const json::exception& e) {
        return Err(file.string() + ": " + e.what());
    }
}

template<typename T>
Result<void> save_array(const fs::path& file, const std::vector<T>& items) {
    const json doc = items;
    return write_file(file, doc.dump(2));
}

} // namespace

LocalStore::LocalStore(fs::path storage_dir)
    : storage_dir_(std::move(storage_dir)) {
}

Result<std::vector<model::PeerInfo>> LocalStore::load_peers() const {
    if (storage_dir_.empty()) {
        return Ok(std::vector<model::PeerInfo>{});
    }

    auto peers = load_array<model::PeerInfo>(storage_dir_ / kPeersFile);
    if (peers.is_error()) {
        return Err(peers.error());
    }
    for (auto& peer : peers.value()) {
        peer.online = false;
    }
    spdlog::debug("Loaded {} cached peers", peers.value().size());
    return peers;
}

Result<void> LocalStore::save_peers(const std::vector<model::PeerInfo>& peers) const {
    if (storage_dir_.empty()) {
        return Ok();
    }
    return save_array(storage_dir_ / kPeersFile, peers);
}

Result<std::vector<model::SyncProject>> LocalStore::load_projects() const {
    if (storage_dir_.empty()) {
        return Ok(std::vector<model::SyncProject>{});
    }
    return load_array<model::SyncProject>(storage_dir_ / kProjectsFile);
}

Result<void> LocalStore::save_projects(const std::vector<model::SyncProject>& projects) const {
    if (storage_dir_.empty()) {
        return Ok();
    }
    return save_array(storage_dir_ / kProjectsFile, projects);
}

} // namespace taildrive::client
