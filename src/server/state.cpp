#include "taildrive/server/state.hpp"

namespace taildrive::server {

void ReceivedIndex::record(const model::InboundFile& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_file_ = file.name;
    if (file.final_path) {
        paths_[file.name] = *file.final_path;
    }
}

void ReceivedIndex::record_if_empty(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_file_) {
        last_file_ = name;
    }
}

void ReceivedIndex::forget(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    paths_.erase(name);
    if (last_file_ && *last_file_ == name) {
        last_file_.reset();
    }
}

std::optional<std::string> ReceivedIndex::last_file() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_file_;
}

std::optional<std::string> ReceivedIndex::path_for(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = paths_.find(name);
    if (it == paths_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<model::PeerInfo> PeerCache::without_self() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::PeerInfo> result;
    result.reserve(peers_.size());
    for (const auto& peer : peers_) {
        if (!peer.is_self) {
            result.push_back(peer);
        }
    }
    return result;
}

} // namespace taildrive::server
