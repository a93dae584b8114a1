#include "taildrive/model/json.hpp"

namespace taildrive::model {

using json = nlohmann::json;

void to_json(json& j, const SentFileInfo& info) {
    j = json{
        {"name", info.name},
        {"peer_id", info.peer_id},
        {"size", info.size},
        {"timestamp", info.timestamp},
        {"succeeded", info.succeeded},
        {"sending", info.sending},
    };
}

void from_json(const json& j, SentFileInfo& info) {
    j.at("name").get_to(info.name);
    info.peer_id = j.value("peer_id", "");
    info.size = j.value("size", uint64_t{0});
    info.timestamp = j.value("timestamp", uint64_t{0});
    info.succeeded = j.value("succeeded", false);
    info.sending = j.value("sending", false);
}

void to_json(json& j, const WaitingFile& file) {
    j = json{{"name", file.name}, {"size", file.size}};
}

void from_json(const json& j, WaitingFile& file) {
    j.at("name").get_to(file.name);
    file.size = j.value("size", uint64_t{0});
}

void to_json(json& j, const RemoteFile& file) {
    j = json{
        {"name", file.name},
        {"is_dir", file.is_dir},
        {"size", file.size},
        {"modified", file.modified},
    };
}

void from_json(const json& j, RemoteFile& file) {
    j.at("name").get_to(file.name);
    file.is_dir = j.value("is_dir", false);
    file.size = j.value("size", int64_t{0});
    file.modified = j.value("modified", uint64_t{0});
}

void to_json(json& j, const PeerInfo& peer) {
    j = json{
        {"id", peer.id},
        {"hostname", peer.hostname},
        {"dns_name", peer.dns_name},
        {"ip_addresses", peer.ip_addresses},
        {"online", peer.online},
        {"os", peer.os},
    };
}

void from_json(const json& j, PeerInfo& peer) {
    j.at("id").get_to(peer.id);
    peer.hostname = j.value("hostname", "");
    peer.dns_name = j.value("dns_name", "");
    peer.ip_addresses = j.value("ip_addresses", std::vector<std::string>{});
    peer.online = j.value("online", false);
    peer.os = j.value("os", "");
    peer.is_self = false;
}

void to_json(json& j, const SyncProject& project) {
    j = json{
        {"id", project.id},
        {"local_path", project.local_path},
        {"remote_path", project.remote_path},
        {"last_synced", project.last_synced},
        {"paused", project.paused},
    };
}

void from_json(const json& j, SyncProject& project) {
    j.at("id").get_to(project.id);
    j.at("local_path").get_to(project.local_path);
    j.at("remote_path").get_to(project.remote_path);
    project.last_synced = j.value("last_synced", uint64_t{0});
    project.paused = j.value("paused", false);
}

void to_json(json& j, const SyncChange& change) {
    j = json{
        {"id", change.id},
        {"remote_path", change.remote_path},
        {"local_path", change.local_path},
        {"new_modified", change.new_modified},
    };
}

void from_json(const json& j, SyncChange& change) {
    j.at("id").get_to(change.id);
    j.at("remote_path").get_to(change.remote_path);
    j.at("local_path").get_to(change.local_path);
    j.at("new_modified").get_to(change.new_modified);
}

json status_to_json(const StatusSnapshot& status) {
    json j;
    j["last_sent_file"] = status.last_sent ? json(*status.last_sent) : json(nullptr);
    j["last_received_file"] = status.last_received_file ? json(*status.last_received_file) : json(nullptr);
    j["server_cwd"] = status.server_cwd ? json(*status.server_cwd) : json(nullptr);
    return j;
}

StatusSnapshot status_from_json(const json& j) {
    StatusSnapshot status;
    if (j.contains("last_sent_file") && !j["last_sent_file"].is_null()) {
        status.last_sent = j["last_sent_file"].get<SentFileInfo>();
    }
    if (j.contains("last_received_file") && j["last_received_file"].is_string()) {
        status.last_received_file = j["last_received_file"].get<std::string>();
    }
    if (j.contains("server_cwd") && j["server_cwd"].is_string()) {
        status.server_cwd = j["server_cwd"].get<std::string>();
    }
    return status;
}

} // namespace taildrive::model
