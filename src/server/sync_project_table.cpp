#include "taildrive/server/sync_project_table.hpp"
#include "taildrive/core/file_util.hpp"
#include "taildrive/model/json.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>

namespace taildrive::server {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

TableError table_error(TableError::Kind kind, std::string message) {
    TableError error;
    error.kind = kind;
    error.message = std::move(message);
    return error;
}

} // namespace

SyncProjectTable::SyncProjectTable(fs::path store_file)
    : store_file_(std::move(store_file)) {
}

Result<void> SyncProjectTable::load() {
    if (store_file_.empty()) {
        return Ok();
    }

    std::error_code ec;
    if (!fs::exists(store_file_, ec)) {
        spdlog::info("No sync project store at {}, starting empty", store_file_.string());
        return Ok();
    }

    auto contents = read_file(store_file_);
    if (contents.is_error()) {
        return Err(contents.error());
    }

    const auto& bytes = contents.value();
    json doc = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        return Err("Sync project store " + store_file_.string() + " is not a JSON array");
    }

    std::vector<model::SyncProject> loaded;
    try {
        loaded = doc.get<std::vector<model::SyncProject>>();
    } catch (const json::exception& e) {
        return Err("Sync project store " + store_file_.string() + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    projects_ = std::move(loaded);
    spdlog::info("Loaded {} sync projects from {}", projects_.size(), store_file_.string());
    return Ok();
}

std::vector<model::SyncProject> SyncProjectTable::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return projects_;
}

std::size_t SyncProjectTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return projects_.size();
}

TableResult<model::SyncProject> SyncProjectTable::create(const std::string& local_path,
                                                         const std::string& remote_path) {
    if (local_path.empty() || remote_path.empty()) {
        return Err(table_error(TableError::Kind::InvalidArgument,
                               "local_path and remote_path are required"));
    }

    model::SyncProject project;
    project.local_path = local_path;
    project.remote_path = remote_path;
    project.last_synced = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    do {
        project.id = generate_id();
    } while (std::any_of(projects_.begin(), projects_.end(),
                         [&](const model::SyncProject& p) { return p.id == project.id; }));

    projects_.push_back(project);
    auto persisted = persist_locked();
    if (persisted.is_error()) {
        projects_.pop_back();
        return Err(table_error(TableError::Kind::Storage, persisted.error()));
    }

    spdlog::info("Created sync project {}: {} <-> {}", project.id, local_path, remote_path);
    return Ok(project);
}

TableResult<void> SyncProjectTable::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(projects_.begin(), projects_.end(),
                           [&](const model::SyncProject& p) { return p.id == id; });
    if (it == projects_.end()) {
        return Err(table_error(TableError::Kind::NotFound, "Unknown sync project: " + id));
    }

    const auto index = static_cast<std::size_t>(std::distance(projects_.begin(), it));
    model::SyncProject removed = *it;
    projects_.erase(it);

    auto persisted = persist_locked();
    if (persisted.is_error()) {
        projects_.insert(projects_.begin() + static_cast<std::ptrdiff_t>(index), removed);
        return Err(table_error(TableError::Kind::Storage, persisted.error()));
    }

    spdlog::info("Deleted sync project {}", id);
    return Ok();
}

TableResult<model::SyncProject> SyncProjectTable::acknowledge(const std::string& id, uint64_t timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(projects_.begin(), projects_.end(),
                           [&](const model::SyncProject& p) { return p.id == id; });
    if (it == projects_.end()) {
        return Err(table_error(TableError::Kind::NotFound, "Unknown sync project: " + id));
    }

    if (timestamp <= it->last_synced) {
        return Ok(*it);
    }

    const uint64_t previous = it->last_synced;
    it->last_synced = timestamp;
    auto persisted = persist_locked();
    if (persisted.is_error()) {
        it->last_synced = previous;
        return Err(table_error(TableError::Kind::Storage, persisted.error()));
    }

    spdlog::debug("Sync project {} acknowledged up to {}", id, timestamp);
    return Ok(*it);
}

TableResult<model::SyncProject> SyncProjectTable::set_paused(const std::string& id, bool paused) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(projects_.begin(), projects_.end(),
                           [&](const model::SyncProject& p) { return p.id == id; });
    if (it == projects_.end()) {
        return Err(table_error(TableError::Kind::NotFound, "Unknown sync project: " + id));
    }
    if (it->paused == paused) {
        return Ok(*it);
    }

    it->paused = paused;
    auto persisted = persist_locked();
    if (persisted.is_error()) {
        it->paused = !paused;
        return Err(table_error(TableError::Kind::Storage, persisted.error()));
    }

    spdlog::info("Sync project {} {}", id, paused ? "paused" : "resumed");
    return Ok(*it);
}

std::vector<model::SyncChange> SyncProjectTable::check() const {
    const auto projects = list();

    std::vector<model::SyncChange> changes;
    for (const auto& project : projects) {
        if (project.paused) {
            continue;
        }
        auto modified = file_mtime(project.local_path);
        if (modified.is_error()) {
            spdlog::debug("Skipping sync project {}: {}", project.id, modified.error());
            continue;
        }
        if (modified.value() > project.last_synced) {
            model::SyncChange change;
            change.id = project.id;
            change.remote_path = project.remote_path;
            change.local_path = project.local_path;
            change.new_modified = modified.value();
            changes.push_back(std::move(change));
        }
    }
    return changes;
}

Result<void> SyncProjectTable::persist_locked() const {
    if (store_file_.empty()) {
        return Ok();
    }
    const json doc = projects_;
    return write_file(store_file_, doc.dump(2));
}

std::string SyncProjectTable::generate_id() {
    static thread_local std::mt19937_64 generator{std::random_device{}()};
    return fmt::format("{:016x}", generator());
}

} // namespace taildrive::server
