#pragma once

#include <queue>
#include <string>
#include <variant>

namespace arbor {

class NavigationController;

struct KeyEvent {
    std::string key;
};

struct ResizeEvent {
    int view_height = 0;
};

using Event = std::variant<KeyEvent, ResizeEvent>;

// Single-consumer FIFO. Key presses and resizes go through the same queue
// so each one is fully applied before the next is looked at.
class EventQueue {
public:
    void push(Event event);
    void push_key(std::string key) { push(KeyEvent{std::move(key)}); }
    void push_resize(int view_height) { push(ResizeEvent{view_height}); }

    // Process every queued event in order. Returns the number processed.
    size_t drain(NavigationController& controller);

    [[nodiscard]] bool empty() const { return events_.empty(); }
    [[nodiscard]] size_t size() const { return events_.size(); }

private:
    std::queue<Event> events_;
};

} // namespace arbor
