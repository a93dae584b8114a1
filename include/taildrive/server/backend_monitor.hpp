#pragma once

#include "taildrive/server/state.hpp"
#include "taildrive/server/transfer_backend.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace taildrive::server {

/**
 * @brief Periodic backend poll: peer refresh and inbox fallback
 *
 * The inbox check catches files that arrived before the process started (the
 * event bus only reports new transfers); it seeds the latest received file
 * only when none is known yet.
 */
class BackendMonitor {
public:
    BackendMonitor(TransferBackend& backend, ServerState& state, std::chrono::seconds interval);
    ~BackendMonitor();

    BackendMonitor(const BackendMonitor&) = delete;
    BackendMonitor& operator=(const BackendMonitor&) = delete;

    void start();
    void stop();

    /**
     * @brief One refresh pass; failures are logged and leave the state as is
     */
    void run_once();

private:
    void run();

    TransferBackend& backend_;
    ServerState& state_;
    std::chrono::seconds interval_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
};

} // namespace taildrive::server
