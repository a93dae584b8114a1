#pragma once

#include "taildrive/core/result.hpp"
#include "taildrive/model/types.hpp"
#include "taildrive/server/state.hpp"
#include "taildrive/server/transfer_backend.hpp"

#include <boost/asio/thread_pool.hpp>

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace taildrive::server {

/**
 * @brief Pushes desktop files to peers in the background
 *
 * Sends run one at a time on a single-thread pool. The SentFileInfo slot is
 * set to `sending = true` before send() returns and is finished with
 * `sending = false` once the backend answers, unless a newer send has taken
 * the slot in the meantime.
 */
class FileSender {
public:
    FileSender(TransferBackend& backend, SentInfoSlot& slot);
    ~FileSender();

    FileSender(const FileSender&) = delete;
    FileSender& operator=(const FileSender&) = delete;

    /**
     * @brief Queue a send; fails immediately when `path` is not a regular file
     * @return The in-progress slot value
     */
    Result<model::SentFileInfo> send(const std::string& peer_id, const std::filesystem::path& path);

    /**
     * @brief Block until every queued send has finished
     */
    void wait_idle();

private:
    void run_send(model::SentFileInfo info, std::filesystem::path path, uint64_t generation);

    TransferBackend& backend_;
    SentInfoSlot& slot_;
    boost::asio::thread_pool pool_;

    std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::size_t in_flight_ = 0;
};

} // namespace taildrive::server
