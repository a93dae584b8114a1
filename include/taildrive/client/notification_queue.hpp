#pragma once

#include "taildrive/model/types.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace taildrive::client {

struct Notification {
    std::string title;
    std::string body;
};

/**
 * @brief FIFO of user-visible notifications plus the transition tracker
 *        that decides when a polled status deserves one
 *
 * observe() is fed every status snapshot. A notification is produced only
 * on a real transition, never on the first value seen, so a freshly started
 * client does not announce files that were already there:
 *
 * - last received file changes to a new name while a previous one was known
 *   → ("File Ready", "Tap to download: NAME")
 * - last sent file is marked succeeded under a new name while a previous
 *   succeeded name was known → ("File Sent", "Desktop sent: NAME")
 *
 * The sent name is only tracked once `succeeded` is true; an in-progress
 * send would otherwise record the name and swallow the completion.
 *
 * All methods are thread-safe.
 */
class NotificationQueue {
public:
    void push(std::string title, std::string body);

    void observe(const std::optional<std::string>& last_received,
                 const std::optional<model::SentFileInfo>& last_sent);

    bool has_pending() const;

    /**
     * @brief Title of the front notification without removing it; "" if empty
     */
    std::string front_title() const;

    /**
     * @brief Body of the front notification, which is removed; "" if empty
     */
    std::string consume_body();

    std::optional<Notification> pop();

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::deque<Notification> pending_;
    std::optional<std::string> last_known_received_;
    std::optional<std::string> last_known_sent_;
};

} // namespace taildrive::client
