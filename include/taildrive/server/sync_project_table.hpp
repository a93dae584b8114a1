#pragma once

#include "taildrive/core/result.hpp"
#include "taildrive/model/types.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace taildrive::server {

struct TableError {
    enum class Kind {
        NotFound,          ///< Unknown project id
        InvalidArgument,   ///< Rejected input, nothing changed
        Storage            ///< Persisting failed; the change was rolled back
    };

    Kind kind = Kind::NotFound;
    std::string message;
};

template<typename T>
using TableResult = Result<T, TableError>;

/**
 * @brief The desktop's sync-project table and its durable copy
 *
 * Every mutation rewrites the whole JSON document before returning. When the
 * write fails the in-memory table is restored, so memory and disk never
 * disagree about an acknowledged change.
 *
 * Watermarks are monotonic: acknowledge() with an older timestamp succeeds
 * but leaves `last_synced` where it was.
 */
class SyncProjectTable {
public:
    /**
     * @param store_file JSON file holding the table; an empty path keeps the
     *                   table in memory only
     */
    explicit SyncProjectTable(std::filesystem::path store_file);

    /**
     * @brief Read the store file; a missing file means an empty table
     */
    Result<void> load();

    std::vector<model::SyncProject> list() const;

    std::size_t size() const;

    TableResult<model::SyncProject> create(const std::string& local_path,
                                           const std::string& remote_path);

    TableResult<void> remove(const std::string& id);

    TableResult<model::SyncProject> acknowledge(const std::string& id, uint64_t timestamp);

    TableResult<model::SyncProject> set_paused(const std::string& id, bool paused);

    /**
     * @brief Non-paused projects whose desktop file is newer than the watermark
     *
     * Projects whose desktop file is missing are skipped. File metadata is
     * read without holding the table lock.
     */
    std::vector<model::SyncChange> check() const;

    const std::filesystem::path& store_file() const { return store_file_; }

private:
    // Caller holds mutex_
    Result<void> persist_locked() const;

    static std::string generate_id();

    std::filesystem::path store_file_;
    mutable std::mutex mutex_;
    std::vector<model::SyncProject> projects_;
};

} // namespace taildrive::server
