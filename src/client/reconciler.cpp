#include "taildrive/client/reconciler.hpp"
#include "taildrive/client/notification_queue.hpp"
#include "taildrive/client/remote_api.hpp"
#include "taildrive/core/file_util.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace taildrive::client {

namespace fs = std::filesystem;

namespace {

std::string display_name(const std::string& path) {
    const std::string name = fs::path(path).filename().string();
    return name.empty() ? path : name;
}

} // namespace

Reconciler::Reconciler(RemoteApi& api, NotificationQueue* notifications)
    : api_(api)
    , notifications_(notifications) {
}

ReconcileReport Reconciler::run(const std::vector<model::SyncProject>& projects,
                                const std::vector<model::SyncChange>& changes,
                                const EventSink& emit) {
    ReconcileReport report;

    for (const auto& project : projects) {
        if (project.paused) {
            continue;
        }

        try {
            uint64_t watermark = project.last_synced;
            if (!pull_changes(project, changes, watermark, report, emit)) {
                continue;
            }
            push_if_newer(project, watermark, report, emit);
        } catch (const std::exception& e) {
            ++report.failed;
            spdlog::error("Reconciling project {} failed: {}", project.id, e.what());
            emit(ErrorEvent{"Sync of " + display_name(project.remote_path) + " failed: " + e.what()});
        }
    }

    if (report.pulled > 0 || report.pushed > 0 || report.failed > 0) {
        spdlog::info("Reconcile tick: {} pulled, {} pushed, {} failed",
                     report.pulled, report.pushed, report.failed);
    }
    return report;
}

bool Reconciler::pull_changes(const model::SyncProject& project,
                              const std::vector<model::SyncChange>& changes,
                              uint64_t& watermark,
                              ReconcileReport& report,
                              const EventSink& emit) {
    bool all_applied = true;

    for (const auto& change : changes) {
        if (change.id != project.id) {
            continue;
        }

        auto fetched = api_.pull(change.local_path);
        if (fetched.is_error()) {
            ++report.failed;
            all_applied = false;
            spdlog::warn("Pull of {} for project {} failed: {}", change.local_path, project.id, fetched.error());
            emit(ErrorEvent{"Sync pull failed: " + fetched.error()});
            continue;
        }

        const fs::path target(change.remote_path);
        auto written = write_file(target, fetched.value().data);
        if (written.is_error()) {
            ++report.failed;
            all_applied = false;
            spdlog::warn("Cannot write {}: {}", change.remote_path, written.error());
            emit(ErrorEvent{"Sync pull failed: " + written.error()});
            continue;
        }

        auto stamped = set_file_mtime(target, change.new_modified);
        if (stamped.is_error()) {
            // The next push check would see a fresh mtime and bounce the file back
            ++report.failed;
            all_applied = false;
            spdlog::warn("{}", stamped.error());
            emit(ErrorEvent{"Sync pull failed: " + stamped.error()});
            continue;
        }

        auto acked = api_.ack(project.id, change.new_modified);
        if (acked.is_error()) {
            ++report.failed;
            all_applied = false;
            spdlog::warn("Ack for project {} failed: {}", project.id, acked.error());
            emit(ErrorEvent{"Sync ack failed: " + acked.error()});
            continue;
        }

        if (change.new_modified > watermark) {
            watermark = change.new_modified;
        }
        ++report.pulled;
        spdlog::info("Pulled {} -> {}", change.local_path, change.remote_path);
        emit(SyncPullCompletedEvent{project.id, change.remote_path, change.new_modified});
        notify("Pulled " + display_name(change.remote_path));
    }

    return all_applied;
}

void Reconciler::push_if_newer(const model::SyncProject& project,
                               uint64_t watermark,
                               ReconcileReport& report,
                               const EventSink& emit) {
    const fs::path source(project.remote_path);
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        spdlog::debug("Project {}: {} not present on this side", project.id, project.remote_path);
        return;
    }

    auto mtime = file_mtime(source);
    if (mtime.is_error()) {
        ++report.failed;
        emit(ErrorEvent{"Sync push failed: " + mtime.error()});
        return;
    }
    const uint64_t modified = mtime.value();
    if (modified <= watermark) {
        return;
    }

    auto uploaded = api_.sync_upload(source, project.local_path, modified);
    if (uploaded.is_error()) {
        ++report.failed;
        spdlog::warn("Push of {} for project {} failed: {}", project.remote_path, project.id, uploaded.error());
        emit(ErrorEvent{"Sync push failed: " + uploaded.error()});
        return;
    }

    auto acked = api_.ack(project.id, modified);
    if (acked.is_error()) {
        ++report.failed;
        spdlog::warn("Ack for project {} failed: {}", project.id, acked.error());
        emit(ErrorEvent{"Sync ack failed: " + acked.error()});
        return;
    }

    ++report.pushed;
    spdlog::info("Pushed {} -> {}", project.remote_path, project.local_path);
    emit(UploadCompletedEvent{project.remote_path, project.local_path, project.id});
    notify("Pushed " + display_name(project.remote_path));
}

void Reconciler::notify(const std::string& body) {
    if (notifications_) {
        notifications_->push("Sync Complete", body);
    }
}

} // namespace taildrive::client
