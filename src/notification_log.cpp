#include "notification_log.hpp"

namespace arbor {

void NotificationLog::push(NotificationLevel level, std::string message) {
    entries_.push_back({std::chrono::steady_clock::now(), level, std::move(message)});
    if (entries_.size() > kMaxEntries) {
        entries_.pop_front();
    }
}

std::vector<Notification> NotificationLog::recent(std::chrono::steady_clock::duration max_age) const {
    const auto cutoff = std::chrono::steady_clock::now() - max_age;
    std::vector<Notification> result;
    for (const auto& entry : entries_) {
        if (entry.timestamp > cutoff) {
            result.push_back(entry);
        }
    }
    return result;
}

void NotificationLog::clear() {
    entries_.clear();
}

} // namespace arbor
