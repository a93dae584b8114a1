#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace taildrive::model {

/**
 * @brief The most recent outbound transfer (one slot per desktop node)
 *
 * A send starts with `sending = true`; the slot is then updated in place
 * with `sending = false` and the outcome in `succeeded`.
 */
struct SentFileInfo {
    std::string name;
    std::string peer_id;
    uint64_t size = 0;
    uint64_t timestamp = 0;      ///< Unix seconds when the send started
    bool succeeded = false;
    bool sending = false;

    bool operator==(const SentFileInfo& other) const {
        return name == other.name && peer_id == other.peer_id && size == other.size &&
               timestamp == other.timestamp && succeeded == other.succeeded &&
               sending == other.sending;
    }
    bool operator!=(const SentFileInfo& other) const { return !(*this == other); }
};

/**
 * @brief A file sitting in the desktop's inbound inbox
 */
struct WaitingFile {
    std::string name;
    uint64_t size = 0;
};

/**
 * @brief One entry of a desktop directory listing
 */
struct RemoteFile {
    std::string name;
    bool is_dir = false;
    int64_t size = 0;            ///< Bytes; 0 for directories
    uint64_t modified = 0;       ///< Unix seconds
};

/**
 * @brief A node on the overlay network
 */
struct PeerInfo {
    std::string id;
    std::string hostname;
    std::string dns_name;
    std::vector<std::string> ip_addresses;
    bool online = false;
    std::string os;
    bool is_self = false;        ///< Never serialized; dropped from GET /peers
};

/**
 * @brief A tracked mirror between one desktop file and one mobile file
 *
 * `local_path` always names the desktop file and `remote_path` the mobile
 * file. `last_synced` is the watermark both sides have agreed on.
 */
struct SyncProject {
    std::string id;
    std::string local_path;
    std::string remote_path;
    uint64_t last_synced = 0;
    bool paused = false;
};

/**
 * @brief A desktop-side change the mobile node has not acknowledged yet
 */
struct SyncChange {
    std::string id;
    std::string remote_path;
    std::string local_path;
    uint64_t new_modified = 0;
};

/**
 * @brief Decoded GET /status payload
 */
struct StatusSnapshot {
    std::optional<SentFileInfo> last_sent;
    std::optional<std::string> last_received_file;
    std::optional<std::string> server_cwd;
};

/**
 * @brief Bytes fetched by a download or pull
 */
struct DownloadedFile {
    std::string filename;
    std::vector<uint8_t> data;
};

/**
 * @brief A completed or waiting inbound transfer seen on the daemon's event bus
 */
struct InboundFile {
    std::string name;
    std::optional<std::string> final_path;   ///< Set once the file is on disk
    uint64_t size = 0;
    std::string from_peer;
};

} // namespace taildrive::model
