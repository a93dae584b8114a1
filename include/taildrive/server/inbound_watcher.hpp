#pragma once

#include "taildrive/server/transfer_backend.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace taildrive::server {

/**
 * @brief Follows the daemon's event bus on a dedicated thread
 *
 * When the stream fails or ends it is re-opened after `retry_delay`, until
 * stop() is called. The callback runs on the watcher thread and must return
 * quickly: the bus drops notifications for readers that fall behind.
 */
class InboundWatcher {
public:
    InboundWatcher(TransferBackend& backend, InboundCallback on_file, std::chrono::seconds retry_delay);
    ~InboundWatcher();

    InboundWatcher(const InboundWatcher&) = delete;
    InboundWatcher& operator=(const InboundWatcher&) = delete;

    void start();
    void stop();

    bool is_running() const { return running_; }

private:
    void run();

    TransferBackend& backend_;
    InboundCallback on_file_;
    std::chrono::seconds retry_delay_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace taildrive::server
