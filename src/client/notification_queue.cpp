#include "taildrive/client/notification_queue.hpp"

#include <spdlog/spdlog.h>

namespace taildrive::client {

void NotificationQueue::push(std::string title, std::string body) {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("Notification queued: {}: {}", title, body);
    pending_.push_back(Notification{std::move(title), std::move(body)});
}

void NotificationQueue::observe(const std::optional<std::string>& last_received,
                                const std::optional<model::SentFileInfo>& last_sent) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (last_received != last_known_received_) {
        if (last_received && last_known_received_) {
            pending_.push_back(Notification{"File Ready", "Tap to download: " + *last_received});
        }
        last_known_received_ = last_received;
    }

    if (last_sent && last_sent->succeeded && last_known_sent_ != last_sent->name) {
        if (last_known_sent_) {
            pending_.push_back(Notification{"File Sent", "Desktop sent: " + last_sent->name});
        }
        last_known_sent_ = last_sent->name;
    }
}

bool NotificationQueue::has_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !pending_.empty();
}

std::string NotificationQueue::front_title() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.empty() ? std::string() : pending_.front().title;
}

std::string NotificationQueue::consume_body() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) {
        return "";
    }
    std::string body = std::move(pending_.front().body);
    pending_.pop_front();
    return body;
}

std::optional<Notification> NotificationQueue::pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) {
        return std::nullopt;
    }
    Notification front = std::move(pending_.front());
    pending_.pop_front();
    return front;
}

std::size_t NotificationQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace taildrive::client
