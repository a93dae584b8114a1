#pragma once

#include "taildrive/client/messages.hpp"
#include "taildrive/model/types.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace taildrive::client {

class RemoteApi;
class NotificationQueue;

using EventSink = std::function<void(Event)>;

struct ReconcileReport {
    std::size_t pulled = 0;
    std::size_t pushed = 0;
    std::size_t failed = 0;
};

/**
 * @brief One reconciliation tick across all tracked projects
 *
 * For every non-paused project:
 *
 * 1. Pull. Each pending SyncChange is fetched from the desktop, written to
 *    the mobile path, stamped with the desktop mtime and acknowledged. The
 *    project's watermark advances to the acknowledged time.
 * 2. Push. If the mobile file is newer than the watermark (including one
 *    advanced by step 1) it is uploaded with its mtime and acknowledged.
 *
 * A project whose pull failed is not pushed in the same tick, so a stale
 * mobile copy never overwrites a desktop change that has not arrived yet.
 * A failing project never stops the others. Results are reported through
 * `emit`: SyncPullCompletedEvent, UploadCompletedEvent (with project id) or
 * ErrorEvent.
 */
class Reconciler {
public:
    Reconciler(RemoteApi& api, NotificationQueue* notifications = nullptr);

    ReconcileReport run(const std::vector<model::SyncProject>& projects,
                        const std::vector<model::SyncChange>& changes,
                        const EventSink& emit);

private:
    // Returns false if any change for the project could not be applied
    bool pull_changes(const model::SyncProject& project,
                      const std::vector<model::SyncChange>& changes,
                      uint64_t& watermark,
                      ReconcileReport& report,
                      const EventSink& emit);

    void push_if_newer(const model::SyncProject& project,
                       uint64_t watermark,
                       ReconcileReport& report,
                       const EventSink& emit);

    void notify(const std::string& body);

    RemoteApi& api_;
    NotificationQueue* notifications_;
};

} // namespace taildrive::client
