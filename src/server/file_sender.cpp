#include "taildrive/server/file_sender.hpp"
#include "taildrive/core/file_util.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <system_error>

namespace taildrive::server {

namespace fs = std::filesystem;

FileSender::FileSender(TransferBackend& backend, SentInfoSlot& slot)
    : backend_(backend)
    , slot_(slot)
    , pool_(1) {
}

FileSender::~FileSender() {
    pool_.join();
}

Result<model::SentFileInfo> FileSender::send(const std::string& peer_id, const fs::path& path) {
    if (peer_id.empty()) {
        return Err(std::string("peer_id is required"));
    }

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Err("Not a regular file: " + path.string());
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Err("Cannot stat " + path.string() + ": " + ec.message());
    }

    model::SentFileInfo info;
    info.name = path.filename().string();
    info.peer_id = peer_id;
    info.size = static_cast<uint64_t>(size);
    info.timestamp = unix_now();
    info.sending = true;
    info.succeeded = false;
    const auto generation = slot_.begin(info);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++in_flight_;
    }
    boost::asio::post(pool_, [this, info, path, generation]() { run_send(info, path, generation); });

    spdlog::info("Queued send of {} ({} bytes) to {}", info.name, info.size, peer_id);
    return Ok(info);
}

void FileSender::run_send(model::SentFileInfo info, fs::path path, uint64_t generation) {
    auto result = backend_.push_file(info.peer_id, path);

    info.sending = false;
    info.succeeded = result.is_ok();
    info.timestamp = unix_now();
    if (!slot_.finish(generation, info)) {
        spdlog::debug("Send of {} finished after a newer send took the slot", info.name);
    }

    if (result.is_error()) {
        spdlog::error("Failed to send {} to {}: {}", info.name, info.peer_id, result.error().describe());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
    idle_cv_.notify_all();
}

void FileSender::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return in_flight_ == 0; });
}

} // namespace taildrive::server
