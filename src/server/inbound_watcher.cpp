#include "taildrive/server/inbound_watcher.hpp"

#include <spdlog/spdlog.h>

namespace taildrive::server {

InboundWatcher::InboundWatcher(TransferBackend& backend, InboundCallback on_file,
                               std::chrono::seconds retry_delay)
    : backend_(backend)
    , on_file_(std::move(on_file))
    , retry_delay_(retry_delay) {
}

InboundWatcher::~InboundWatcher() {
    stop();
}

void InboundWatcher::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&InboundWatcher::run, this);
}

void InboundWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void InboundWatcher::run() {
    auto keep_running = [this]() { return running_.load(); };

    while (running_) {
        spdlog::info("Watching daemon event bus for inbound files");
        auto result = backend_.watch_inbound(on_file_, keep_running);
        if (!running_) {
            break;
        }
        if (result.is_error()) {
            spdlog::warn("Event bus watch failed: {}; retrying in {}s",
                         result.error().describe(), retry_delay_.count());
        } else {
            spdlog::info("Event bus stream ended; reconnecting in {}s", retry_delay_.count());
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, retry_delay_, [this]() { return !running_; });
    }
    spdlog::debug("Inbound watcher stopped");
}

} // namespace taildrive::server
