#include "taildrive/client/sync_worker.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace taildrive::client {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

SyncWorker::SyncWorker(std::shared_ptr<network::HttpTransport> transport,
                       std::shared_ptr<CommandChannel> commands,
                       std::shared_ptr<EventChannel> events,
                       LocalStore store,
                       std::vector<model::PeerInfo> cached_peers,
                       NotificationQueue* notifications,
                       WorkerOptions options)
    : api_(std::move(transport))
    , commands_(std::move(commands))
    , events_(std::move(events))
    , store_(std::move(store))
    , peers_(std::move(cached_peers))
    , reconciler_(api_, notifications)
    , options_(options)
    , last_poll_(Clock::now() - options.poll_interval) {
}

SyncWorker::~SyncWorker() {
    stop();
}

void SyncWorker::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread([this]() { run(); });
    spdlog::debug("Sync worker started");
}

void SyncWorker::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
        spdlog::debug("Sync worker stopped");
    }
}

void SyncWorker::run() {
    while (running_) {
        if (!tick()) {
            break;
        }
        commands_->wait_for(options_.tick);
    }
    running_ = false;
}

void SyncWorker::force_poll() {
    last_poll_ = Clock::now() - options_.poll_interval;
}

bool SyncWorker::tick() {
    if (!drain_commands()) {
        return false;
    }

    const auto now = Clock::now();
    if (now - last_poll_ >= options_.poll_interval) {
        last_poll_ = now;
        try {
            if (poll_remote()) {
                reconcile();
            }
        } catch (const std::exception& e) {
            spdlog::error("Poll failed: {}", e.what());
            emit(ErrorEvent{std::string("Poll failed: ") + e.what()});
        }
    }

    return events_open_;
}

bool SyncWorker::drain_commands() {
    while (auto command = commands_->try_pop()) {
        try {
            handle(*command);
        } catch (const std::exception& e) {
            spdlog::error("Command failed: {}", e.what());
            emit(ErrorEvent{e.what()});
        }
        if (!events_open_) {
            return false;
        }
    }
    return !commands_->is_closed();
}

bool SyncWorker::emit(Event event) {
    if (events_open_ && !events_->push(std::move(event))) {
        spdlog::debug("Event channel closed, worker will exit");
        events_open_ = false;
    }
    return events_open_;
}

void SyncWorker::handle(const Command& command) {
    std::visit(Overloaded{
        [this](const DownloadFileCommand& cmd) {
            auto file = api_.download(cmd.name);
            if (file.is_error()) {
                emit(ErrorEvent{file.error()});
                return;
            }
            emit(DownloadCompletedEvent{std::move(file.value())});
        },
        [this](const DownloadLastCommand&) {
            auto file = api_.download_last();
            if (file.is_error()) {
                emit(ErrorEvent{file.error()});
                return;
            }
            emit(DownloadCompletedEvent{std::move(file.value())});
        },
        [this](const BrowseCommand& cmd) {
            auto entries = api_.browse(cmd.path);
            if (entries.is_error()) {
                emit(ErrorEvent{entries.error()});
                return;
            }
            emit(BrowseUpdatedEvent{std::move(entries.value())});
        },
        [this](const PullFileCommand& cmd) {
            auto file = api_.pull(cmd.path);
            if (file.is_error()) {
                emit(ErrorEvent{file.error()});
                return;
            }
            emit(PullCompletedEvent{std::move(file.value())});
        },
        [this](const RefreshCommand&) {
            force_poll();
        },
        [this](const UploadFileCommand& cmd) {
            const std::string remote = cmd.remote_name && !cmd.remote_name->empty()
                ? *cmd.remote_name
                : fs::path(cmd.local_path).filename().string();
            auto uploaded = api_.upload(cmd.local_path, remote);
            if (uploaded.is_error()) {
                emit(ErrorEvent{uploaded.error()});
                return;
            }
            emit(UploadCompletedEvent{cmd.local_path, remote, std::nullopt});
        },
        [this](const CreateSyncProjectCommand& cmd) {
            auto created = api_.create_project(cmd.mobile_path, cmd.desktop_path);
            if (created.is_error()) {
                emit(ErrorEvent{created.error()});
                return;
            }
            spdlog::info("Created sync project {}: {} <-> {}",
                         created.value().id, cmd.desktop_path, cmd.mobile_path);
            refresh_projects();
        },
        [this](const DeleteSyncProjectCommand& cmd) {
            auto removed = api_.delete_project(cmd.id);
            if (removed.is_error()) {
                emit(ErrorEvent{removed.error()});
                return;
            }
            refresh_projects();
        },
        [this](const FetchSyncProjectsCommand&) {
            refresh_projects();
        },
    }, command);
}

void SyncWorker::refresh_projects() {
    auto projects = api_.projects();
    if (projects.is_error()) {
        emit(ErrorEvent{projects.error()});
        return;
    }
    publish_projects(projects.value());
}

void SyncWorker::publish_projects(const std::vector<model::SyncProject>& projects) {
    auto saved = store_.save_projects(projects);
    if (saved.is_error()) {
        spdlog::warn("Cannot persist sync projects: {}", saved.error());
    }
    emit(SyncProjectsUpdatedEvent{projects});
}

bool SyncWorker::poll_remote() {
    auto status = api_.status();
    if (status.is_error()) {
        spdlog::debug("Status poll failed: {}", status.error());
        for (auto& peer : peers_) {
            peer.online = false;
        }
        emit(StatusUpdatedEvent{false, std::nullopt, std::nullopt, std::nullopt});
        emit(PeersUpdatedEvent{peers_});
        return false;
    }

    auto& snapshot = status.value();
    emit(StatusUpdatedEvent{true, std::move(snapshot.last_sent),
                            std::move(snapshot.last_received_file), std::move(snapshot.server_cwd)});

    auto files = api_.files();
    if (files.is_ok()) {
        emit(FilesUpdatedEvent{std::move(files.value())});
    } else {
        spdlog::debug("Inbox poll failed: {}", files.error());
    }

    auto peers = api_.peers();
    if (peers.is_ok()) {
        peers_ = std::move(peers.value());
        auto saved = store_.save_peers(peers_);
        if (saved.is_error()) {
            spdlog::warn("Cannot persist peer cache: {}", saved.error());
        }
        emit(PeersUpdatedEvent{peers_});
    } else {
        spdlog::debug("Peer poll failed: {}", peers.error());
    }

    return true;
}

void SyncWorker::reconcile() {
    auto projects = api_.projects();
    if (projects.is_error()) {
        spdlog::warn("Cannot fetch sync projects: {}", projects.error());
        return;
    }
    publish_projects(projects.value());

    auto changes = api_.check();
    if (changes.is_error()) {
        spdlog::warn("Sync check failed: {}", changes.error());
        return;
    }
    if (!changes.value().empty()) {
        emit(SyncChangesAvailableEvent{changes.value()});
    }

    reconciler_.run(projects.value(), changes.value(), [this](Event event) { emit(std::move(event)); });
}

} // namespace taildrive::client
