#pragma once

#include "taildrive/client/local_store.hpp"
#include "taildrive/client/messages.hpp"
#include "taildrive/client/notification_queue.hpp"
#include "taildrive/client/sync_worker.hpp"
#include "taildrive/core/config.hpp"
#include "taildrive/core/result.hpp"

#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace taildrive::client {

/**
 * @brief What the foreground renders; only process_events() mutates it
 */
struct ClientState {
    std::string server_url;
    bool connected = false;
    std::string status_message = "Connecting...";
    std::optional<model::SentFileInfo> last_sent;
    std::optional<std::string> last_received_file;
    std::optional<std::string> server_cwd;
    std::vector<model::WaitingFile> waiting_files;
    std::vector<model::RemoteFile> remote_files;
    std::vector<model::PeerInfo> peers;
    std::vector<model::SyncProject> projects;
    std::vector<model::SyncChange> pending_changes;
    std::optional<std::string> download_status;
    std::optional<std::string> browse_status;
    std::optional<std::string> upload_status;
    std::optional<std::string> sync_status;
};

/**
 * @brief Builds the transport for a server URL
 */
using TransportFactory =
    std::function<Result<std::shared_ptr<network::HttpTransport>>(const std::string& server_url)>;

/**
 * @brief Foreground facade over the sync worker
 *
 * Commands are queued without blocking. process_events() is meant to be
 * called from the UI loop; it folds worker events into ClientState, saves
 * downloaded and pulled bytes to the save directory (queuing the written
 * path for the share sheet) and feeds the notification tracker.
 *
 * Not thread-safe: use one SyncClient from one thread. The worker it owns
 * runs on its own thread.
 */
class SyncClient {
public:
    explicit SyncClient(ClientConfig config, TransportFactory factory = {});
    ~SyncClient();

    SyncClient(const SyncClient&) = delete;
    SyncClient& operator=(const SyncClient&) = delete;

    /**
     * @brief Load the peer cache and start the worker for config.server_url
     */
    Result<void> start();

    void stop();

    /**
     * @brief Tear down the worker and start a fresh one against `server_url`
     *
     * The peer cache and save directory carry over; per-connection state
     * (status, inbox, listings) is reset.
     */
    Result<void> reconnect(const std::string& server_url);

    /**
     * @brief Apply all queued events; returns how many were processed
     */
    std::size_t process_events();

    void download_file(const std::string& name);
    void download_last();
    void browse(std::optional<std::string> path = std::nullopt);
    void pull_file(const std::string& desktop_path);
    void refresh();
    void upload_file(const std::string& local_path, std::optional<std::string> remote_name = std::nullopt);
    void create_sync_project(const std::string& mobile_path, const std::string& desktop_path);
    void delete_sync_project(const std::string& id);
    void fetch_sync_projects();

    const ClientState& state() const { return state_; }

    NotificationQueue& notifications() { return notifications_; }

    void set_save_directory(const std::filesystem::path& dir) { save_directory_ = dir; }
    const std::filesystem::path& save_directory() const { return save_directory_; }

    bool has_pending_share() const { return !pending_share_paths_.empty(); }

    /**
     * @brief Pop the next saved file path; "" when none
     */
    std::string consume_pending_share_path();

    bool is_running() const { return worker_ != nullptr && worker_->is_running(); }

private:
    Result<void> launch_worker();

    void apply(Event event);

    // Writes a fetched file into the save directory and returns the status line
    std::string save_file(const model::DownloadedFile& file, const char* verb);

    ClientConfig config_;
    TransportFactory factory_;
    LocalStore store_;
    NotificationQueue notifications_;
    ClientState state_;
    std::filesystem::path save_directory_;
    std::deque<std::string> pending_share_paths_;

    std::shared_ptr<CommandChannel> commands_;
    std::shared_ptr<EventChannel> events_;
    std::unique_ptr<SyncWorker> worker_;
};

/**
 * @brief "512 B", "1.50 KB", "3.00 MB", "1.25 GB"
 */
std::string format_size(uint64_t bytes);

/**
 * @brief Coarse age of a unix timestamp relative to `now`
 *
 * "Unknown" for 0, then "Just now", "N min ago", "N hr ago", "N days ago".
 */
std::string format_timestamp(uint64_t timestamp, uint64_t now);

} // namespace taildrive::client
