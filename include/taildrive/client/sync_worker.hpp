#pragma once

#include "taildrive/client/channel.hpp"
#include "taildrive/client/local_store.hpp"
#include "taildrive/client/messages.hpp"
#include "taildrive/client/reconciler.hpp"
#include "taildrive/client/remote_api.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace taildrive::client {

class NotificationQueue;

using CommandChannel = Channel<Command>;
using EventChannel = Channel<Event>;

struct WorkerOptions {
    std::chrono::milliseconds poll_interval{3000};
    std::chrono::milliseconds tick{100};
};

/**
 * @brief Background poll loop of the mobile node
 *
 * Owns the RemoteApi, the peer cache and every piece of poll state; the
 * foreground reaches it only through the two channels. Each tick:
 *
 * 1. Drains pending commands; each one is a single HTTP call answered by
 *    exactly one event (its success event or an ErrorEvent).
 * 2. When the poll interval has elapsed, fetches status, inbox and peers.
 *    A failed status call reports disconnected and republishes the cached
 *    peers marked offline; the cache itself is never emptied.
 * 3. After a successful poll, fetches the project table and pending
 *    changes and runs one reconciliation pass.
 * 4. Waits for the tick interval, waking early when a command arrives.
 *
 * The loop ends on stop(), when the command channel is closed, or when the
 * event channel is closed by the foreground.
 */
class SyncWorker {
public:
    SyncWorker(std::shared_ptr<network::HttpTransport> transport,
               std::shared_ptr<CommandChannel> commands,
               std::shared_ptr<EventChannel> events,
               LocalStore store,
               std::vector<model::PeerInfo> cached_peers,
               NotificationQueue* notifications,
               WorkerOptions options = {});
    ~SyncWorker();

    SyncWorker(const SyncWorker&) = delete;
    SyncWorker& operator=(const SyncWorker&) = delete;

    void start();

    void stop();

    bool is_running() const { return running_; }

    /**
     * @brief One iteration without the trailing wait
     *
     * Returns false once the loop should end. Exposed so tests can drive
     * the worker deterministically without starting the thread.
     */
    bool tick();

    /**
     * @brief Make the next tick poll regardless of the interval
     */
    void force_poll();

    // Only meaningful while the thread is not running
    const std::vector<model::PeerInfo>& peers() const { return peers_; }

private:
    void run();

    bool drain_commands();

    void handle(const Command& command);

    // Returns true if the desktop answered
    bool poll_remote();

    void reconcile();

    // Fetch the table and publish it; failures become an ErrorEvent
    void refresh_projects();

    void publish_projects(const std::vector<model::SyncProject>& projects);

    // False once the event channel has been closed
    bool emit(Event event);

    RemoteApi api_;
    std::shared_ptr<CommandChannel> commands_;
    std::shared_ptr<EventChannel> events_;
    LocalStore store_;
    std::vector<model::PeerInfo> peers_;
    Reconciler reconciler_;
    WorkerOptions options_;

    std::chrono::steady_clock::time_point last_poll_;
    std::atomic<bool> running_{false};
    bool events_open_ = true;
    std::thread thread_;
};

} // namespace taildrive::client
