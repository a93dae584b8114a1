#pragma once

#include "taildrive/model/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace taildrive::client {

// ────────────────────────────────────────────────────────────
// Commands (foreground → worker)
// ────────────────────────────────────────────────────────────

struct DownloadFileCommand {
    std::string name;
};

struct DownloadLastCommand {};

struct BrowseCommand {
    std::optional<std::string> path;   ///< Desktop directory; server home when empty
};

struct PullFileCommand {
    std::string path;                  ///< Absolute desktop path
};

// Performs no I/O; makes the next tick poll immediately
struct RefreshCommand {};

struct UploadFileCommand {
    std::string local_path;                     ///< Mobile file to send
    std::optional<std::string> remote_name;     ///< Path under the upload root; basename by default
};

struct CreateSyncProjectCommand {
    std::string mobile_path;
    std::string desktop_path;
};

struct DeleteSyncProjectCommand {
    std::string id;
};

struct FetchSyncProjectsCommand {};

using Command = std::variant<DownloadFileCommand,
                             DownloadLastCommand,
                             BrowseCommand,
                             PullFileCommand,
                             RefreshCommand,
                             UploadFileCommand,
                             CreateSyncProjectCommand,
                             DeleteSyncProjectCommand,
                             FetchSyncProjectsCommand>;

// ────────────────────────────────────────────────────────────
// Events (worker → foreground)
// ────────────────────────────────────────────────────────────

struct StatusUpdatedEvent {
    bool connected = false;
    std::optional<model::SentFileInfo> last_sent;
    std::optional<std::string> last_received_file;
    std::optional<std::string> server_cwd;
};

struct FilesUpdatedEvent {
    std::vector<model::WaitingFile> files;
};

struct BrowseUpdatedEvent {
    std::vector<model::RemoteFile> entries;
};

struct DownloadCompletedEvent {
    model::DownloadedFile file;
};

struct PullCompletedEvent {
    model::DownloadedFile file;
};

struct PeersUpdatedEvent {
    std::vector<model::PeerInfo> peers;
};

struct SyncProjectsUpdatedEvent {
    std::vector<model::SyncProject> projects;
};

struct SyncChangesAvailableEvent {
    std::vector<model::SyncChange> changes;
};

struct UploadCompletedEvent {
    std::string local_path;
    std::string remote_path;
    std::optional<std::string> project_id;   ///< Set when pushed by reconciliation
};

struct SyncPullCompletedEvent {
    std::string project_id;
    std::string written_path;                ///< Mobile path that was updated
    uint64_t modified = 0;
};

struct ErrorEvent {
    std::string message;
};

using Event = std::variant<StatusUpdatedEvent,
                           FilesUpdatedEvent,
                           BrowseUpdatedEvent,
                           DownloadCompletedEvent,
                           PullCompletedEvent,
                           PeersUpdatedEvent,
                           SyncProjectsUpdatedEvent,
                           SyncChangesAvailableEvent,
                           UploadCompletedEvent,
                           SyncPullCompletedEvent,
                           ErrorEvent>;

// Helper for std::visit with a set of lambdas
template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace taildrive::client
