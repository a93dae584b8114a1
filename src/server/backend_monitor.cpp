#include "taildrive/server/backend_monitor.hpp"

#include <spdlog/spdlog.h>

namespace taildrive::server {

BackendMonitor::BackendMonitor(TransferBackend& backend, ServerState& state, std::chrono::seconds interval)
    : backend_(backend)
    , state_(state)
    , interval_(interval) {
}

BackendMonitor::~BackendMonitor() {
    stop();
}

void BackendMonitor::start() {
    if (thread_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&BackendMonitor::run, this);
}

void BackendMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void BackendMonitor::run_once() {
    auto peers = backend_.list_peers();
    if (peers.is_ok()) {
        spdlog::debug("Peer refresh: {} nodes", peers.value().size());
        state_.peers.replace(std::move(peers.value()));
    } else {
        spdlog::warn("Peer refresh failed: {}", peers.error().describe());
    }

    auto inbox = backend_.list_inbox();
    if (inbox.is_ok()) {
        for (const auto& file : inbox.value()) {
            state_.received.record_if_empty(file.name);
        }
    } else {
        spdlog::debug("Inbox check failed: {}", inbox.error().describe());
    }
}

void BackendMonitor::run() {
    spdlog::info("Backend monitor running every {}s", interval_.count());
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        lock.unlock();
        run_once();
        lock.lock();
        cv_.wait_for(lock, interval_, [this]() { return stop_requested_; });
    }
    spdlog::debug("Backend monitor stopped");
}

} // namespace taildrive::server
