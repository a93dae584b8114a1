#include "taildrive/client/sync_client.hpp"
#include "taildrive/core/file_util.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace taildrive::client {

namespace fs = std::filesystem;

namespace {

Result<std::shared_ptr<network::HttpTransport>> default_transport(const std::string& url,
                                                                  std::chrono::milliseconds timeout) {
    auto endpoint = network::Endpoint::from_url(url);
    if (endpoint.is_error()) {
        return Err(endpoint.error());
    }
    std::shared_ptr<network::HttpTransport> transport =
        std::make_shared<network::AsioHttpTransport>(std::move(endpoint.value()), timeout);
    return Ok(std::move(transport));
}

} // namespace

SyncClient::SyncClient(ClientConfig config, TransportFactory factory)
    : config_(std::move(config))
    , factory_(std::move(factory))
    , store_(config_.storage_dir)
    , save_directory_(config_.save_directory) {
    if (!factory_) {
        const auto timeout = std::chrono::milliseconds(config_.http_timeout_ms);
        factory_ = [timeout](const std::string& url) { return default_transport(url, timeout); };
    }
    state_.server_url = config_.server_url;
}

SyncClient::~SyncClient() {
    stop();
}

Result<void> SyncClient::start() {
    if (worker_) {
        return Err(std::string("Sync client already started"));
    }

    auto cached = store_.load_peers();
    if (cached.is_ok()) {
        state_.peers = std::move(cached.value());
    } else {
        spdlog::warn("Ignoring peer cache: {}", cached.error());
    }

    auto projects = store_.load_projects();
    if (projects.is_ok()) {
        state_.projects = std::move(projects.value());
    } else {
        spdlog::warn("Ignoring project mirror: {}", projects.error());
    }

    return launch_worker();
}

Result<void> SyncClient::launch_worker() {
    auto transport = factory_(config_.server_url);
    if (transport.is_error()) {
        return Err(transport.error());
    }

    commands_ = std::make_shared<CommandChannel>();
    events_ = std::make_shared<EventChannel>();

    WorkerOptions options;
    options.poll_interval = std::chrono::milliseconds(config_.poll_interval_ms);
    options.tick = std::chrono::milliseconds(config_.tick_ms);

    worker_ = std::make_unique<SyncWorker>(std::move(transport.value()), commands_, events_,
                                           store_, state_.peers, &notifications_, options);
    worker_->start();
    spdlog::info("Syncing with {}", config_.server_url);
    return Ok();
}

void SyncClient::stop() {
    if (!worker_) {
        return;
    }
    commands_->close();
    events_->close();
    worker_->stop();
    state_.peers = worker_->peers();
    worker_.reset();
}

Result<void> SyncClient::reconnect(const std::string& server_url) {
    spdlog::info("Reconnecting to {}", server_url);
    stop();

    config_.server_url = server_url;
    std::vector<model::PeerInfo> peers = std::move(state_.peers);
    for (auto& peer : peers) {
        peer.online = false;
    }

    state_ = ClientState{};
    state_.server_url = server_url;
    state_.peers = std::move(peers);
    return launch_worker();
}

std::size_t SyncClient::process_events() {
    if (!events_) {
        return 0;
    }

    std::size_t processed = 0;
    while (auto event = events_->try_pop()) {
        apply(std::move(*event));
        ++processed;
    }
    return processed;
}

void SyncClient::apply(Event event) {
    std::visit(Overloaded{
        [this](StatusUpdatedEvent& e) {
            state_.connected = e.connected;
            state_.last_sent = std::move(e.last_sent);
            state_.last_received_file = std::move(e.last_received_file);
            if (e.server_cwd) {
                state_.server_cwd = std::move(e.server_cwd);
            }
            state_.status_message = e.connected ? "Connected to server" : "Cannot reach server";
            notifications_.observe(state_.last_received_file, state_.last_sent);
        },
        [this](FilesUpdatedEvent& e) {
            state_.waiting_files = std::move(e.files);
        },
        [this](BrowseUpdatedEvent& e) {
            state_.browse_status = "Found " + std::to_string(e.entries.size()) + " items";
            state_.remote_files = std::move(e.entries);
        },
        [this](DownloadCompletedEvent& e) {
            state_.download_status = save_file(e.file, "Downloaded");
        },
        [this](PullCompletedEvent& e) {
            state_.browse_status = save_file(e.file, "Pulled");
        },
        [this](PeersUpdatedEvent& e) {
            state_.peers = std::move(e.peers);
        },
        [this](SyncProjectsUpdatedEvent& e) {
            state_.projects = std::move(e.projects);
        },
        [this](SyncChangesAvailableEvent& e) {
            state_.pending_changes = std::move(e.changes);
        },
        [this](UploadCompletedEvent& e) {
            const std::string name = fs::path(e.local_path).filename().string();
            if (e.project_id) {
                state_.sync_status = "✓ Pushed '" + name + "'";
            } else {
                state_.upload_status = "✓ Uploaded '" + name + "' to " + e.remote_path;
            }
        },
        [this](SyncPullCompletedEvent& e) {
            state_.sync_status = "✓ Pulled '" + fs::path(e.written_path).filename().string() + "'";
        },
        [this](ErrorEvent& e) {
            spdlog::warn("{}", e.message);
            state_.download_status = "✗ " + e.message;
        },
    }, event);
}

std::string SyncClient::save_file(const model::DownloadedFile& file, const char* verb) {
    // Never let a server-supplied name escape the save directory
    std::string name = fs::path(file.filename).filename().string();
    if (name.empty() || name == "." || name == "..") {
        name = "download";
    }
    const std::string size = format_size(file.data.size());

    if (save_directory_.empty()) {
        return std::string("✓ ") + verb + " '" + name + "' (" + size + "), no save directory set";
    }

    const fs::path target = save_directory_ / name;
    auto written = write_file(target, file.data);
    if (written.is_error()) {
        spdlog::error("Failed to save {}: {}", name, written.error());
        return "✗ Failed to save '" + name + "': " + written.error();
    }

    spdlog::info("Saved {} ({})", target.string(), size);
    pending_share_paths_.push_back(target.string());
    return "✓ Saved '" + name + "' (" + size + ")";
}

std::string SyncClient::consume_pending_share_path() {
    if (pending_share_paths_.empty()) {
        return "";
    }
    std::string path = std::move(pending_share_paths_.front());
    pending_share_paths_.pop_front();
    return path;
}

namespace {

void send_command(const std::shared_ptr<CommandChannel>& commands, Command command) {
    if (!commands || !commands->push(std::move(command))) {
        spdlog::warn("Sync client is not running, command dropped");
    }
}

} // namespace

void SyncClient::download_file(const std::string& name) {
    send_command(commands_, DownloadFileCommand{name});
}

void SyncClient::download_last() {
    send_command(commands_, DownloadLastCommand{});
}

void SyncClient::browse(std::optional<std::string> path) {
    send_command(commands_, BrowseCommand{std::move(path)});
}

void SyncClient::pull_file(const std::string& desktop_path) {
    send_command(commands_, PullFileCommand{desktop_path});
}

void SyncClient::refresh() {
    send_command(commands_, RefreshCommand{});
}

void SyncClient::upload_file(const std::string& local_path, std::optional<std::string> remote_name) {
    send_command(commands_, UploadFileCommand{local_path, std::move(remote_name)});
}

void SyncClient::create_sync_project(const std::string& mobile_path, const std::string& desktop_path) {
    send_command(commands_, CreateSyncProjectCommand{mobile_path, desktop_path});
}

void SyncClient::delete_sync_project(const std::string& id) {
    send_command(commands_, DeleteSyncProjectCommand{id});
}

void SyncClient::fetch_sync_projects() {
    send_command(commands_, FetchSyncProjectsCommand{});
}

std::string format_size(uint64_t bytes) {
    constexpr uint64_t kKB = 1024;
    constexpr uint64_t kMB = kKB * 1024;
    constexpr uint64_t kGB = kMB * 1024;

    if (bytes >= kGB) {
        return fmt::format("{:.2f} GB", static_cast<double>(bytes) / kGB);
    }
    if (bytes >= kMB) {
        return fmt::format("{:.2f} MB", static_cast<double>(bytes) / kMB);
    }
    if (bytes >= kKB) {
        return fmt::format("{:.2f} KB", static_cast<double>(bytes) / kKB);
    }
    return fmt::format("{} B", bytes);
}

std::string format_timestamp(uint64_t timestamp, uint64_t now) {
    if (timestamp == 0) {
        return "Unknown";
    }
    const uint64_t diff = now > timestamp ? now - timestamp : 0;
    if (diff < 60) {
        return "Just now";
    }
    if (diff < 3600) {
        return fmt::format("{} min ago", diff / 60);
    }
    if (diff < 86400) {
        return fmt::format("{} hr ago", diff / 3600);
    }
    return fmt::format("{} days ago", diff / 86400);
}

} // namespace taildrive::client
