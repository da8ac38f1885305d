#pragma once

#include <chrono>
#include <deque>
#include <string>
#include <vector>

namespace arbor {

enum class NotificationLevel {
    Info,
    Error
};

// User-visible message surfaced on the status line
struct Notification {
    std::chrono::steady_clock::time_point timestamp;
    NotificationLevel level = NotificationLevel::Info;
    std::string message;
};

class NotificationLog {
public:
    void push(NotificationLevel level, std::string message);

    // Entries younger than max_age, oldest first
    [[nodiscard]] std::vector<Notification> recent(
        std::chrono::steady_clock::duration max_age = std::chrono::seconds(10)) const;

    [[nodiscard]] const std::deque<Notification>& all() const { return entries_; }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    void clear();

    static constexpr size_t kMaxEntries = 32;

private:
    std::deque<Notification> entries_;
};

} // namespace arbor
